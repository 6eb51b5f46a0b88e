/**
 * @file http_ctx.hxx
 * @brief Per-request context passed through the middleware chain to the handler.
 */

#ifndef ROUTEKIT_HTTP_HTTP_CTX_HXX
#define ROUTEKIT_HTTP_HTTP_CTX_HXX

namespace routekit::http {
    /**
     * @brief Request plus the parameters resolved against the matched route's descriptors.
     */
    struct http_ctx_t {
        ROUTEKIT_INLINE http_ctx_t() = default;

        /**
         * @brief Constructor initializing with request and resolved parameters.
         * @param request Raw request.
         * @param params Coerced path parameters.
         * @param query Coerced query parameters.
         */
        ROUTEKIT_INLINE http_ctx_t(request_t request, values_t params, query_values_t query = {})
            : m_request(std::move(request)), m_params(std::move(params)), m_query(std::move(query)) {
        }

      public:
        ROUTEKIT_INLINE http_ctx_t(const http_ctx_t&) = delete;

        ROUTEKIT_INLINE http_ctx_t& operator=(const http_ctx_t&) = delete;

        ROUTEKIT_INLINE http_ctx_t(http_ctx_t&&) = default;

        ROUTEKIT_INLINE http_ctx_t& operator=(http_ctx_t&&) = default;

      public:
        /**
         * @brief Typed access to a resolved path parameter.
         * @tparam _type_t One of std::string, std::int64_t, bool.
         * @param name Parameter name.
         * @return The value, or nullopt if it is absent or holds another type.
         */
        template <typename _type_t>
        [[nodiscard]] ROUTEKIT_INLINE std::optional<_type_t> param(const std::string& name) const {
            const auto it = m_params.find(name);

            if (it == m_params.end())
                return std::nullopt;

            if (const auto* value = std::get_if<_type_t>(&it->second))
                return *value;

            return std::nullopt;
        }

        /**
         * @brief Typed access to the first value of a resolved query parameter.
         */
        template <typename _type_t>
        [[nodiscard]] ROUTEKIT_INLINE std::optional<_type_t> query(const std::string& name) const {
            const auto it = m_query.find(name);

            if (it == m_query.end() || it->second.empty())
                return std::nullopt;

            if (const auto* value = std::get_if<_type_t>(&it->second.front()))
                return *value;

            return std::nullopt;
        }

        /**
         * @brief Every value of a resolved array query parameter holding @p _type_t.
         */
        template <typename _type_t>
        [[nodiscard]] ROUTEKIT_INLINE std::vector<_type_t> query_all(const std::string& name) const {
            std::vector<_type_t> values{};

            const auto it = m_query.find(name);

            if (it == m_query.end())
                return values;

            for (const auto& value : it->second) {
                if (const auto* typed = std::get_if<_type_t>(&value))
                    values.push_back(*typed);
            }

            return values;
        }

      public:
        ROUTEKIT_INLINE auto& request() { return m_request; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& request() const { return m_request; }

        ROUTEKIT_INLINE auto& params() { return m_params; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& params() const { return m_params; }

        ROUTEKIT_INLINE auto& query_values() { return m_query; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& query_values() const { return m_query; }

        /**
         * @brief Declared, non-optional query parameters that resolved to nothing.
         *
         * The core does not reject such requests; handlers or a validating middleware decide.
         */
        ROUTEKIT_INLINE auto& missing_query() { return m_missing_query; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& missing_query() const { return m_missing_query; }

      private:
        /** @brief Raw request. */
        request_t m_request{};

        /** @brief Coerced path parameters. */
        values_t m_params{};

        /** @brief Coerced query parameters. */
        query_values_t m_query{};

        /** @brief Required query parameters with no usable value. */
        std::vector<std::string> m_missing_query{};
    };
}

#endif // ROUTEKIT_HTTP_HTTP_CTX_HXX
