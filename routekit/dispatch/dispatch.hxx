/**
 * @file dispatch.hxx
 * @brief Compiled route lookup, parameter coercion, and request dispatch.
 */

#ifndef ROUTEKIT_DISPATCH_HXX
#define ROUTEKIT_DISPATCH_HXX

namespace routekit::dispatch {
    /**
     * @brief Dispatcher settings.
     */
    struct dispatch_cfg_t {
        /** @brief Treat "/a/" like "/a" when matching raw paths. (default: true) */
        bool m_ignore_trailing_slash{true};

        /** @brief Split comma-separated values of array query parameters. (default: true) */
        bool m_split_query_arrays{true};
    };

    /**
     * @brief Emitted once per dispatched request, after the response is produced.
     */
    struct request_log_t {
        /** @brief Request method, upper case. */
        std::string m_method{};

        /** @brief Request path. */
        std::string m_path{};

        /** @brief Time spent in dispatch, in milliseconds. */
        double m_elapsed_ms{};
    };

    /** @brief Receiver of request log events; called from the dispatching coroutine. */
    using log_sink_t = std::function<void(const request_log_t&)>;

    /**
     * @brief Sink writing "METHOD path 1.234ms" through the global logger at info level.
     */
    log_sink_t default_log_sink();

    /**
     * @brief Coerce one raw value against a descriptor.
     *
     * A regex override must match first. Enum-restricted descriptors accept the
     * listed values; a value outside the list is accepted only by a non-string
     * type of the same group, as in (number|all). Otherwise every declared type
     * is tried in order: string
     * passes through, number needs the whole value to be a signed 64-bit
     * integer, boolean accepts "true" and "false", regex passes through.
     *
     * @return The typed value, or nullopt when the value is dropped.
     */
    std::optional<http::value_t> coerce(const path::param_descriptor_t& descriptor, const std::string_view& raw);

    /**
     * @brief Coerce raw path parameters; undeclared names are ignored, failures dropped.
     */
    http::values_t coerce_params(const path::params_t& descriptors, const http::params_t& raw);

    /**
     * @brief Query coercion result.
     */
    struct query_result_t {
        /** @brief Coerced values; non-array parameters hold at most one value. */
        http::query_values_t m_values{};

        /** @brief Declared, non-optional parameters without any usable value. */
        std::vector<std::string> m_missing{};
    };

    /**
     * @brief Coerce raw query values against the route's query descriptors.
     * @param split Split comma-separated values of array parameters.
     */
    query_result_t coerce_query(const path::params_t& descriptors, const http::query_t& raw, bool split);

    /**
     * @brief One route table entry ready to serve: the entry plus one composed chain per method.
     */
    struct compiled_route_t {
        /**
         * @brief Chain for @p method, falling back to the `all` slot.
         * @return The chain, or nullptr when the route does not serve the method.
         */
        [[nodiscard]] const middleware::next_t* chain_for(const http::e_method& method) const;

        /**
         * @brief Methods served, for the Allow header of a 405.
         */
        [[nodiscard]] std::string allowed() const;

        /** @brief Route table entry, copied at mount time. */
        route::route_entry_t m_entry{};

        /** @brief Middleware chain ending in the handler, by method. */
        boost::unordered_map<http::e_method, middleware::next_t> m_chains{};
    };

    /**
     * @brief Result of matching a raw path.
     */
    struct match_t {
        /** @brief Route table key of the matched entry. */
        std::string m_key{};

        /** @brief Raw path parameter values by name. */
        http::params_t m_params{};
    };

    /**
     * @brief Serves requests against the routes of a mounted router tree.
     *
     * mount() compiles everything up front; afterwards the dispatcher is
     * read-only and dispatch() may run concurrently from any number of
     * coroutines.
     */
    class c_dispatcher {
      public:
        ROUTEKIT_INLINE explicit c_dispatcher(dispatch_cfg_t cfg = {})
            : m_cfg(std::move(cfg)), m_log_sink(default_log_sink()) {}

      public:
        /**
         * @brief Compile every route of @p root, including the root's own handlers.
         *
         * Replaces whatever was mounted before.
         *
         * @throws exceptions::middleware_init_exception_t if any middleware fails to initialize.
         */
        void mount(const route::c_router& root);

        /**
         * @brief Look up a compiled route by route table key.
         */
        [[nodiscard]] const compiled_route_t* find(const std::string& key) const;

        /**
         * @brief Match a raw request path against the compiled routes.
         */
        [[nodiscard]] std::optional<match_t> match(const std::string_view& path) const;

        /**
         * @brief Serve one request.
         *
         * Uses request.route() when the transport already matched the route,
         * otherwise matches request.path(). Exceptions thrown by middlewares or
         * handlers propagate to the caller and no log event is emitted for them.
         *
         * @return The response; 404 for an unknown route, 405 for a known route without the method.
         */
        boost::asio::awaitable<http::response_t> dispatch(http::request_t request) const;

        /**
         * @brief Handler an adapter can register for one route and method.
         *
         * The returned callable routes through dispatch() with request.route()
         * set to @p key; the dispatcher must outlive it.
         */
        [[nodiscard]] std::function<boost::asio::awaitable<http::response_t>(http::request_t)> handler_for(std::string key) const;

      public:
        ROUTEKIT_INLINE void set_log_sink(log_sink_t sink) { m_log_sink = std::move(sink); }

        [[nodiscard]] ROUTEKIT_INLINE const auto& routes() const { return m_routes; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& cfg() const { return m_cfg; }

      private:
        void compile(route::route_entry_t entry);

        void emit(const http::request_t& request, const std::chrono::steady_clock::time_point& started) const;

      private:
        /** @brief Dispatcher settings. */
        dispatch_cfg_t m_cfg{};

        /** @brief Receiver of request log events. */
        log_sink_t m_log_sink{};

        /** @brief Compiled routes by route table key. */
        boost::unordered_map<std::string, compiled_route_t> m_routes{};

        /** @brief Raw path matcher yielding route table keys. */
        route::internal::trie_node_t<std::string> m_matcher{};
    };
}

#endif // ROUTEKIT_DISPATCH_HXX
