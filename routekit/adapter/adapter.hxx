/**
 * @file adapter.hxx
 * @brief Contract between the routing core and an HTTP transport.
 *
 * The core never opens sockets. A transport adapter translates route
 * templates into its own syntax (":id", "{id}", ...), registers one handler
 * per route and method with its framework, and forwards each request it
 * receives to the returned handler.
 */

#ifndef ROUTEKIT_ADAPTER_HXX
#define ROUTEKIT_ADAPTER_HXX

namespace routekit::adapter {
    /** @brief Handler registered with the transport; resolves to the response to send. */
    using request_handler_t = std::function<boost::asio::awaitable<http::response_t>(http::request_t)>;

    /**
     * @brief One route and method, translated for the transport.
     */
    struct loaded_route_t {
        /** @brief Method to register; `all` means every method. */
        http::e_method m_method{};

        /** @brief Path in the transport's syntax. */
        std::string m_path{};

        /** @brief Route table key. */
        std::string m_key{};

        /** @brief Handler serving the route. */
        request_handler_t m_handler{};
    };

    /** @brief Translated routes, sorted by path then method. */
    using loaded_routes_t = std::vector<loaded_route_t>;

    /**
     * @brief Base class for transport adapters.
     *
     * Both virtual methods must be overridden; the defaults throw
     * unimplemented_collaborator_exception_t.
     */
    class c_base_adapter {
      public:
        virtual ~c_base_adapter() = default;

      public:
        /**
         * @brief Spell one path parameter in the transport's syntax.
         * @param name Parameter name.
         * @param descriptor Parameter descriptor, for transports that can express types.
         */
        virtual std::string translate_path_parameter(const std::string& name, const path::param_descriptor_t& descriptor) const;

        /**
         * @brief Register every translated route with the transport.
         */
        virtual void initialize(loaded_routes_t routes);

      public:
        /**
         * @brief Spell a whole path; the empty path becomes "/".
         */
        std::string translate_path(const path::segments_t& segments, const path::params_t& params) const;

        /**
         * @brief Translate every compiled route of @p dispatcher; handlers refer to it.
         */
        loaded_routes_t translate(const dispatch::c_dispatcher& dispatcher) const;
    };
}

#endif // ROUTEKIT_ADAPTER_HXX
