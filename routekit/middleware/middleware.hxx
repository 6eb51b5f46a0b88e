/**
 * @file middleware.hxx
 * @brief Middleware interface and the continuation chain built once per route.
 */

#ifndef ROUTEKIT_MIDDLEWARE_HXX
#define ROUTEKIT_MIDDLEWARE_HXX

namespace routekit::middleware {
    /**
     * @brief Next stage of a chain: the following middleware's run, or the route handler.
     */
    using next_t = std::function<boost::asio::awaitable<http::response_t>(http::http_ctx_t&)>;

    /**
     * @brief Base class for middleware components.
     *
     * An instance is created once per registered route and method, when the
     * chain is built, and then serves every request routed through it,
     * concurrently. Member fields are therefore shared configuration: never
     * store per-request state on the instance.
     */
    class c_base_middleware {
      public:
        virtual ~c_base_middleware() = default;

      public:
        /**
         * @brief Receive the next stage of the chain.
         *
         * Called exactly once, while the chain is built. Overrides may acquire
         * resources or validate configuration; throwing aborts route registration.
         *
         * @param next Continuation to invoke from run().
         */
        virtual void init(next_t next) { m_next = std::move(next); }

        /**
         * @brief Process a request.
         *
         * Either produce a response directly or co_await next(ctx) and
         * optionally post-process what it returns.
         *
         * @param ctx Request context.
         * @return Awaitable that resolves to the response.
         */
        virtual boost::asio::awaitable<http::response_t> run(http::http_ctx_t& ctx) = 0;

      protected:
        /**
         * @brief Invoke the next stage.
         */
        ROUTEKIT_INLINE boost::asio::awaitable<http::response_t> next(http::http_ctx_t& ctx) const { return m_next(ctx); }

      protected:
        /** @brief Continuation set by init(). */
        next_t m_next{};
    };

    /**
     * @brief Shared pointer type for middleware instances.
     */
    using instance_t = std::shared_ptr<c_base_middleware>;

    /**
     * @brief Next descriptor identity; starts at 1.
     */
    ROUTEKIT_INLINE std::uint64_t next_middleware_id() {
        static std::atomic<std::uint64_t> counter{};

        return ++counter;
    }

    /**
     * @brief Declares a middleware on a router: a name plus a factory producing fresh instances.
     *
     * Copies share the identity of the descriptor they were copied from, so two
     * descriptors are equal only when they come from the same declaration.
     */
    struct middleware_t {
        /** @brief Name used in diagnostics. */
        std::string m_name{};

        /** @brief Creates one instance per chain. */
        std::function<instance_t()> m_factory{};

        /** @brief Identity of the declaration. */
        std::uint64_t m_id{next_middleware_id()};

        ROUTEKIT_INLINE bool operator==(const middleware_t& other) const { return m_id == other.m_id && m_name == other.m_name; }
    };

    /** @brief Ordered middleware descriptors, outermost first. */
    using middlewares_t = std::vector<middleware_t>;

    /**
     * @brief Build a descriptor for a middleware type.
     * @tparam _middleware_t Concrete middleware deriving from c_base_middleware.
     * @param name Descriptor name.
     * @param args Constructor arguments, copied into the factory.
     */
    template <typename _middleware_t, typename... _args_t>
    ROUTEKIT_INLINE middleware_t make_middleware(std::string name, _args_t&&... args) {
        static_assert(std::is_base_of_v<c_base_middleware, _middleware_t>, "middleware must derive from c_base_middleware");

        return middleware_t{
            std::move(name),

            [... captured = std::forward<_args_t>(args)]() -> instance_t {
                return std::make_shared<_middleware_t>(captured...);
            }
        };
    }

    /**
     * @brief Compose descriptors and a terminal handler into one callable.
     *
     * Instance i is created, then instance i+1, then i's init() receives i+1's
     * run(); the last instance's init() receives @p terminal. An empty list
     * yields @p terminal unchanged.
     *
     * @param middlewares Descriptors, outermost first.
     * @param terminal Route handler stage.
     * @return The entry point of the chain.
     * @throws exceptions::middleware_init_exception_t if a factory or an init() throws.
     */
    next_t build_chain(const middlewares_t& middlewares, next_t terminal);
}

#endif // ROUTEKIT_MIDDLEWARE_HXX
