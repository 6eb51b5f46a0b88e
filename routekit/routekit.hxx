/**
 * @file routekit.hxx
 * @brief Main public API and configuration structures for routekit.
 */

#ifndef ROUTEKIT_HXX
#define ROUTEKIT_HXX

#include "shared/shared.hxx"

/**
 * @namespace routekit
 * @brief Main namespace for routekit.
 */
namespace routekit {
#ifdef ROUTEKIT_USE_LOGGING_IMPL
    /** @brief Alias for the shared logging implementation. */
    using c_logging = shared::c_logging;

    /** @brief Alias for the shared logging level enumeration. */
    using e_log_level = shared::e_log_level;

    /** @brief Global logger instance for routekit. */
    inline const auto g_logging = std::make_unique<shared::c_logging>();
#endif // ROUTEKIT_USE_LOGGING_IMPL
}

#include "exception/exception.hxx"

#include "http/http.hxx"

#include "path/path.hxx"

#include "middleware/middleware.hxx"

#include "route/route.hxx"

#include "dispatch/dispatch.hxx"

#include "adapter/adapter.hxx"

namespace routekit {
    /**
     * @brief Configuration parameters for routekit.
     */
    struct routekit_cfg_t {
        /** @brief Dispatcher configuration. */
        dispatch::dispatch_cfg_t m_dispatch{};

#ifdef ROUTEKIT_HAS_LOGGING_IMPL
        /**
         * @brief Configuration for the internal routekit logger.
         */
        struct logger_t {
            /** @brief Minimum severity level to log. (default: info) */
            e_log_level m_level{e_log_level::info};

            /** @brief Whether to flush output immediately after each message. (default: false) */
            bool m_force_flush{false};

            /** @brief Enable asynchronous logging. (default: true) */
            bool m_async{true};

            /** @brief Size of the internal log buffer. (default: 16384) */
            std::size_t m_buffer_size{16384u};

            /** @brief Strategy for handling buffer overflows. (default: discard_oldest) */
            c_logging::e_overflow_strategy m_strategy{c_logging::e_overflow_strategy::discard_oldest};
        };

        /** @brief Logger configuration for routekit. */
        logger_t m_logger{};
#endif
    };

    /**
     * @brief Owns the root router and the dispatcher serving it.
     *
     * Routes are declared on root() before start(); start() composes and
     * mounts them, after which handle() serves requests and load() hands the
     * routes to a transport.
     */
    class c_routekit {
      public:
        /**
         * @brief Create an empty root router with the "" template.
         */
        ROUTEKIT_INLINE c_routekit() : m_root(route::path("")), m_running(false) {}

      public:
        /**
         * @brief Apply the configuration, compose the tree and mount it.
         * @param cfg Configuration settings.
         * @throws exceptions::middleware_init_exception_t if a middleware fails to initialize.
         */
        void start(routekit_cfg_t cfg);

        /**
         * @brief Stop serving and flush the logger.
         */
        void stop();

        /**
         * @brief Translate the mounted routes for @p adapter and let it register them.
         * @throws base_exception_t when called before start().
         * @throws exceptions::unimplemented_collaborator_exception_t from an incomplete adapter.
         */
        void load(adapter::c_base_adapter& adapter);

        /**
         * @brief Serve one request.
         * @param request Request filled by the transport.
         * @return Awaitable that resolves to the response.
         * @throws base_exception_t when called before start().
         */
        boost::asio::awaitable<http::response_t> handle(http::request_t request);

      public:
        /**
         * @brief Root of the router tree.
         */
        ROUTEKIT_INLINE auto& root() { return *m_root; }

        /**
         * @brief Get a reference to the configuration.
         */
        ROUTEKIT_INLINE auto& cfg() { return m_cfg; }

        /**
         * @brief Dispatcher built by start().
         */
        ROUTEKIT_INLINE auto& dispatcher() { return m_dispatcher; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& dispatcher() const { return m_dispatcher; }

        /**
         * @brief Get the running state.
         */
        [[nodiscard]] ROUTEKIT_INLINE const auto& running() const { return m_running; }

      private:
        /** @brief Configuration parameters. */
        routekit_cfg_t m_cfg{};

        /** @brief Root router. */
        route::c_router::ptr_t m_root{};

        /** @brief Dispatcher over the mounted tree. */
        dispatch::c_dispatcher m_dispatcher{};

        /** @brief Atomic flag indicating whether requests are served. */
        std::atomic_bool m_running{};
    };
}

#endif // ROUTEKIT_HXX
