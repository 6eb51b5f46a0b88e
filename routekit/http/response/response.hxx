/**
 * @file response.hxx
 * @brief HTTP response value returned by handlers to the transport.
 */

#ifndef ROUTEKIT_HTTP_RESPONSE_HXX
#define ROUTEKIT_HTTP_RESPONSE_HXX

namespace routekit::http {
    /**
     * @brief Status, headers and body produced by a handler.
     *
     * The transport adapter owns serialization; the core only moves this value around.
     */
    struct response_t {
        ROUTEKIT_INLINE response_t() = default;

        /**
         * @brief Construct a plain-text response.
         * @param body The response body.
         * @param status_code The HTTP status code to send (default is 200 OK).
         * @param headers Additional headers; Content-Type defaults to text/plain.
         */
        ROUTEKIT_INLINE response_t(std::string body, const e_status& status_code = e_status::ok, headers_t headers = {})
            : m_body(std::move(body)), m_headers(std::move(headers)), m_status(status_code) {
            m_headers.emplace("Content-Type", "text/plain");
        }

      public:
        ROUTEKIT_INLINE auto& body() { return m_body; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& body() const { return m_body; }

        ROUTEKIT_INLINE auto& headers() { return m_headers; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& headers() const { return m_headers; }

        ROUTEKIT_INLINE auto& status() { return m_status; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& status() const { return m_status; }

      public:
        /** @brief Body. */
        body_t m_body{};

        /** @brief Headers. */
        headers_t m_headers{};

        /** @brief Status code. */
        e_status m_status{e_status::ok};
    };
}

#endif // ROUTEKIT_HTTP_RESPONSE_HXX
