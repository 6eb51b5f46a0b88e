/**
 * @file request.hxx
 * @brief Raw request handed to the dispatcher by a transport adapter.
 *
 * The transport terminates I/O and fills this structure with the method, the
 * path, and the raw string values of path and query parameters. Nothing here
 * is coerced; typing happens in the dispatcher against the route descriptors.
 */

#ifndef ROUTEKIT_HTTP_REQUEST_HXX
#define ROUTEKIT_HTTP_REQUEST_HXX

namespace routekit::http {
    /**
     * @brief Represents an incoming HTTP request as seen by the routing core.
     */
    struct request_t {
        ROUTEKIT_INLINE request_t() = default;

        /**
         * @brief Construct a request for a method and a path.
         * @param method Request method.
         * @param path Request path without the query string.
         */
        ROUTEKIT_INLINE request_t(const e_method& method, path_t path)
            : m_method(method), m_path(std::move(path)) {
        }

      public:
        /**
         * @brief First raw value of a query parameter.
         * @param name Parameter name.
         * @return The value, or nullopt when the parameter is absent.
         */
        [[nodiscard]] ROUTEKIT_INLINE std::optional<std::string_view> query_value(const std::string& name) const {
            const auto it = m_query.find(name);

            if (it == m_query.end() || it->second.empty())
                return std::nullopt;

            return std::string_view{it->second.front()};
        }

        /**
         * @brief Raw value of a header.
         * @param name Header name, case-insensitive.
         * @return The value, or nullopt when the header is absent.
         */
        [[nodiscard]] ROUTEKIT_INLINE std::optional<std::string_view> header(const std::string& name) const {
            const auto it = m_headers.find(name);

            if (it == m_headers.end())
                return std::nullopt;

            return std::string_view{it->second};
        }

      public:
        ROUTEKIT_INLINE auto& method() { return m_method; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& method() const { return m_method; }

        ROUTEKIT_INLINE auto& path() { return m_path; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& path() const { return m_path; }

        /**
         * @brief Route table key the transport already matched, if any.
         *
         * Adapters that register one handler per route (as most frameworks do)
         * set this; when it is empty the dispatcher matches `path()` itself.
         */
        ROUTEKIT_INLINE auto& route() { return m_route; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& route() const { return m_route; }

        ROUTEKIT_INLINE auto& params() { return m_params; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& params() const { return m_params; }

        ROUTEKIT_INLINE auto& query() { return m_query; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& query() const { return m_query; }

        ROUTEKIT_INLINE auto& headers() { return m_headers; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& headers() const { return m_headers; }

        ROUTEKIT_INLINE auto& body() { return m_body; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& body() const { return m_body; }

      private:
        /** @brief HTTP method. */
        e_method m_method{e_method::get};

        /** @brief Request path without query string. */
        path_t m_path{};

        /** @brief Pre-matched route key. */
        std::string m_route{};

        /** @brief Raw path parameter values. */
        params_t m_params{};

        /** @brief Raw query values. */
        query_t m_query{};

        /** @brief HTTP headers. */
        headers_t m_headers{};

        /** @brief Request body, already read by the transport. */
        body_t m_body{};
    };
}

#endif // ROUTEKIT_HTTP_REQUEST_HXX
