/**
 * @file shared.hxx
 * @brief Common includes, macros, and shared namespace for routekit.
 */

#ifndef ROUTEKIT_SHARED_HXX
#define ROUTEKIT_SHARED_HXX

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <exception>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <boost/asio.hpp>
#include <boost/asio/this_coro.hpp>

#include <boost/unordered_map.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/predicate.hpp>

#ifdef __MSVC_COMPILER__
/** @brief Forces function inlining. */
#define ROUTEKIT_INLINE __forceinline

/** @brief Prevents function inlining. */
#define ROUTEKIT_NOINLINE __declspec(noinline)
#elif __CLANG_COMPILER__ || __GCC_COMPILER__ || __INTEL_COMPILER__
/** @brief Forces function inlining. */
#define ROUTEKIT_INLINE __attribute__((always_inline)) inline

/** @brief Prevents function inlining. */
#define ROUTEKIT_NOINLINE __attribute__((noinline))
#else
/** @brief Forces function inlining. */
#define ROUTEKIT_INLINE inline

/** @brief Prevents function inlining. */
#define ROUTEKIT_NOINLINE
#endif // ...

#ifdef ROUTEKIT_USE_LOGGING_IMPL
#include "logging/logging.hxx"
#endif // ROUTEKIT_USE_LOGGING_IMPL

/**
 * @namespace shared
 * @brief Components reused by every routekit module that do not depend on routing types.
 */
namespace shared {
    // ...
}

#endif // ROUTEKIT_SHARED_HXX
