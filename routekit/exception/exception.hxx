/**
 * @file exception.hxx
 * @brief Exception hierarchy used throughout routekit.
 *
 * Every error raised by the library derives from `base_exception_t`, which carries
 * an optional status code and a message prefix naming the failing component.
 * Registration-time errors (template syntax, middleware init, structural misuse)
 * are thrown synchronously while the route tree is assembled.
 */

#ifndef ROUTEKIT_EXCEPTION_HXX
#define ROUTEKIT_EXCEPTION_HXX

namespace routekit {
    /**
     * @brief Base exception type for all errors in routekit.
     */
    struct base_exception_t : public std::runtime_error {
        /**
         * @brief Construct a base exception with a plain message.
         * @param str Error message.
         */
        ROUTEKIT_INLINE base_exception_t(const std::string& str)
            : std::runtime_error(str), m_message(str), m_what(str) {
        }

        /**
         * @brief Construct a base exception with a message, status code, and optional prefix.
         * @param str Error message.
         * @param status Associated status code.
         * @param prefix Optional prefix to include in the formatted message.
         */
        ROUTEKIT_INLINE base_exception_t(const std::string& str, const std::size_t& status, const std::string_view& prefix = "")
            : std::runtime_error(str), m_status(status), m_prefix(prefix), m_message(str) {
            m_what = m_prefix.empty() ? m_message : fmt::format("[{}] {}", m_prefix, m_message);
        }

      public:
        ROUTEKIT_INLINE const auto& status() const { return m_status; }

        ROUTEKIT_INLINE const auto& prefix() const { return m_prefix; }

        ROUTEKIT_INLINE const auto& message() const { return m_message; }

        ROUTEKIT_INLINE const char* what() const noexcept override { return m_what.c_str(); }

      private:
        /** @brief Status code associated with the exception. */
        std::size_t m_status{};

        /** @brief Component prefix, points at a string literal. */
        std::string_view m_prefix{};

        /** @brief Raw message content (without prefix). */
        std::string m_message{};

        /** @brief Cached full message returned by what(). */
        std::string m_what{};
    };

    namespace exceptions {
        /**
         * @brief Malformed path template: unclosed `<`, `{` or `(`, bad name or type, invalid regex.
         *
         * Carries the offending fragment and the zero-based position in the template
         * where the problem starts.
         */
        struct path_template_syntax_exception_t : public base_exception_t {
            /**
             * @param str Description of the problem.
             * @param fragment Offending part of the template.
             * @param position Zero-based offset of the fragment in the template.
             */
            ROUTEKIT_INLINE path_template_syntax_exception_t(
                const std::string& str,

                std::string fragment,
                std::size_t position
            )
                : base_exception_t(fmt::format("{} at position {}: '{}'", str, position, fragment), 0u, "Path-Template"),
                  m_fragment(std::move(fragment)), m_position(position) {
            }

          public:
            ROUTEKIT_INLINE const auto& fragment() const { return m_fragment; }

            ROUTEKIT_INLINE const auto& position() const { return m_position; }

          private:
            std::string m_fragment{};

            std::size_t m_position{};
        };

        /**
         * @brief A middleware failed to construct or to initialize while its chain was built.
         */
        struct middleware_init_exception_t : public base_exception_t {
            /**
             * @param middleware Name of the failing middleware descriptor.
             * @param cause Message of the original error.
             */
            ROUTEKIT_INLINE middleware_init_exception_t(std::string middleware, const std::string_view& cause)
                : base_exception_t(fmt::format("Middleware '{}' failed to initialize: {}", middleware, cause), 0u, "Middleware-Init"),
                  m_middleware(std::move(middleware)) {
            }

          public:
            ROUTEKIT_INLINE const auto& middleware() const { return m_middleware; }

          private:
            std::string m_middleware{};
        };

        /**
         * @brief A transport adapter did not override a method the core relies on.
         */
        struct unimplemented_collaborator_exception_t : public base_exception_t {
            /**
             * @param method Name of the method that must be overridden.
             */
            ROUTEKIT_INLINE unimplemented_collaborator_exception_t(std::string method)
                : base_exception_t(
                      fmt::format("'{}' must be implemented by the transport adapter", method),

                      0u,

                      "Collaborator"
                  ),
                  m_method(std::move(method)) {
            }

          public:
            ROUTEKIT_INLINE const auto& method() const { return m_method; }

          private:
            std::string m_method{};
        };

        /**
         * @brief Structural misuse of the router tree.
         */
        struct route_exception_t : public base_exception_t {
            ROUTEKIT_INLINE route_exception_t(const std::string& str, const std::size_t& status = 0u)
                : base_exception_t(str, status, "Route") {
            }
        };
    }
}

#endif // ROUTEKIT_EXCEPTION_HXX
