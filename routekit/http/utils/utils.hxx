/**
 * @file utils.hxx
 * @brief Small HTTP helpers shared by the request model and the dispatcher.
 */

#ifndef ROUTEKIT_HTTP_UTILS_HXX
#define ROUTEKIT_HTTP_UTILS_HXX

/**
 * @brief Internal namespace for HTTP utilities.
 */
namespace routekit::http::internal {
    /**
     * @brief Case-insensitive comparator for header names.
     */
    struct ci_less_t {
        ROUTEKIT_INLINE bool operator()(const std::string_view& lhs, const std::string_view& rhs) const {
            return boost::algorithm::ilexicographical_compare(lhs, rhs);
        }
    };
}

namespace routekit::http::utils {
    /**
     * @brief Computes the 32-bit FNV-1a hash for the given string.
     * @param str Input string to hash.
     * @return 32-bit FNV-1a hash value.
     *
     * Used to switch on method names at compile time.
     */
    ROUTEKIT_INLINE constexpr std::uint32_t fnv1a_hash(const std::string_view str) {
        std::uint32_t hash = 2166136261u;

        for (const auto c : str) {
            hash ^= static_cast<std::uint8_t>(c);
            hash *= 16777619u;
        }

        return hash;
    }

    /**
     * @brief Removes one trailing slash, keeping a lone "/" intact; an empty path becomes "/".
     */
    ROUTEKIT_INLINE std::string_view trim_trailing_slash(std::string_view path) {
        if (path.empty())
            return "/";

        return (path.size() > 1u && path.back() == '/') ? path.substr(0u, path.size() - 1u) : path;
    }
}

#endif // ROUTEKIT_HTTP_UTILS_HXX
