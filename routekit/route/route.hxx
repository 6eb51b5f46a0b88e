/**
 * @file route.hxx
 * @brief Router tree: handlers, nesting, and the flattened per-node route tables.
 *
 * A router owns one path template, an ordered middleware list, a handler per
 * method and its nested children. Every mutation immediately re-materializes
 * the affected entries into the route table of every ancestor, so a table can
 * be read at any time and always reflects the current tree:
 *
 * @code
 * auto root = route::path("/api");
 * auto users = route::path("/users/<id: number>");
 *
 * root->nested({users});
 * users->get([](http::http_ctx_t& ctx) { return http::response_t("user"); });
 * root->middlewares({auth});
 *
 * // root->routes().at("/users/<id: number>") now carries [auth] and the GET handler,
 * // its m_full_url_path is "/api/users/<id: number>"
 * @endcode
 */

#ifndef ROUTEKIT_ROUTE_HXX
#define ROUTEKIT_ROUTE_HXX

#include "internal/internal.hxx"

namespace routekit::route {
    /**
     * @brief Base interface for route handlers.
     */
    struct route_t {
        virtual ~route_t() = default;

        /**
         * @brief Handle a request.
         * @param ctx Request context; outlives the returned awaitable.
         * @return Awaitable response.
         */
        virtual boost::asio::awaitable<http::response_t> handle_async(http::http_ctx_t& ctx) const = 0;

        /**
         * @brief Whether the wrapped callable is a coroutine.
         */
        virtual bool is_async() const = 0;
    };

    /**
     * @brief Route handler wrapping a sync or async callable.
     * @tparam _fn_t Type of the handler function.
     */
    template <typename _fn_t>
    struct fn_route_t : public route_t {
        static_assert(internal::sync_handler_c<_fn_t> || internal::async_handler_c<_fn_t>,
                      "handler must be callable with http_ctx_t& and return response_t or awaitable<response_t>");

        ROUTEKIT_INLINE explicit fn_route_t(_fn_t&& fn) : m_fn(std::move(fn)) {}

        ROUTEKIT_INLINE explicit fn_route_t(const _fn_t& fn) : m_fn(fn) {}

      public:
        ROUTEKIT_NOINLINE boost::asio::awaitable<http::response_t> handle_async(http::http_ctx_t& ctx) const override {
            if constexpr (internal::async_handler_c<_fn_t>)
                co_return co_await m_fn(ctx);
            else
                co_return m_fn(ctx);
        }

        ROUTEKIT_INLINE bool is_async() const override { return internal::async_handler_c<_fn_t>; }

      private:
        /** @brief Handler function for this route. */
        _fn_t m_fn;
    };

    /** @brief Shared handle to a route handler; the same handler may serve several entries. */
    using handler_t = std::shared_ptr<route_t>;

    /** @brief Handlers by method. Holds either `all` alone or any subset of the specific methods. */
    using handlers_t = std::map<http::e_method, handler_t>;

    /**
     * @brief Wrap a callable as a route handler; an existing handler_t is returned as is.
     */
    template <typename _fn_t>
    ROUTEKIT_INLINE handler_t make_handler(_fn_t&& fn) {
        using fn_t = std::decay_t<_fn_t>;

        if constexpr (std::is_convertible_v<fn_t, handler_t>)
            return handler_t(std::forward<_fn_t>(fn));
        else
            return std::make_shared<fn_route_t<fn_t>>(std::forward<_fn_t>(fn));
    }

    class c_router;

    /**
     * @brief A fully resolved route: complete path, merged middlewares and parameters, handlers.
     */
    struct route_entry_t {
        /**
         * @brief Structural equality; parameter descriptors compare by content, middlewares by declaration, handlers by identity.
         */
        bool operator==(const route_entry_t& other) const;

        /** @brief Concatenated URL templates from this table's owner, inclusive, down to the origin. */
        std::string m_full_url_path{};

        /** @brief Non-empty query templates along the same chain, joined by '&'. */
        std::string m_full_query_path{};

        /** @brief Middlewares, outermost ancestor first. */
        middleware::middlewares_t m_middlewares{};

        /** @brief Path parameter descriptors; deeper declarations replace same-named shallower ones. */
        path::params_t m_path_params{};

        /** @brief Query parameter descriptors, merged like m_path_params. */
        path::params_t m_query_params{};

        /** @brief Literal and parameter segments of m_full_url_path. */
        path::segments_t m_segments{};

        /** @brief Handlers of the origin node. */
        handlers_t m_handlers{};

        /** @brief Node that owns the handlers. */
        const c_router* m_origin{};
    };

    /** @brief Route table: URL template below the owner (its own path excluded) to entry. */
    using routes_t = std::map<std::string, route_entry_t>;

    /**
     * @brief Create a router for a path template.
     * @param path_template Template, see path.hxx.
     * @throws exceptions::path_template_syntax_exception_t on malformed templates.
     */
    std::shared_ptr<c_router> path(const std::string_view& path_template);

    /**
     * @brief Create a router meant to be attached under another one; same as path().
     */
    std::shared_ptr<c_router> nested(const std::string_view& path_template);

    /**
     * @brief One node of the router tree.
     *
     * Children are owned; the parent link is a plain back-pointer and never owns.
     * The tree only grows: there is no detach. All mutators return the router
     * itself for chaining.
     */
    class c_router : public std::enable_shared_from_this<c_router> {
      public:
        /** @brief Owning handle to a router. */
        using ptr_t = std::shared_ptr<c_router>;

        /** @brief Router factory handed to nested() builders. */
        using factory_t = std::function<ptr_t(const std::string_view&)>;

      public:
        /**
         * @brief Parse @p path_template and create a detached router.
         */
        explicit c_router(const std::string_view& path_template);

        c_router(const c_router&) = delete;

        c_router& operator=(const c_router&) = delete;

      public:
        /**
         * @brief Attach children and materialize their routes into this router and every ancestor.
         * @param children Routers without a parent.
         * @throws exceptions::route_exception_t for a null child, a child that already has
         *         a parent, or a child that is this router or one of its ancestors.
         */
        c_router& nested(const std::vector<ptr_t>& children);

        /**
         * @brief Attach the children returned by @p builder, which receives a router factory.
         */
        template <typename _builder_t>
            requires std::is_invocable_r_v<std::vector<ptr_t>, _builder_t, const factory_t&>
        ROUTEKIT_INLINE c_router& nested(_builder_t&& builder) {
            const factory_t factory{[](const std::string_view& path_template) { return route::path(path_template); }};

            return nested(std::invoke(std::forward<_builder_t>(builder), factory));
        }

        /**
         * @brief Append middlewares to this router.
         *
         * Existing entries of this router and of every ancestor are rewritten, so
         * the final order is always ancestors first, then this router's
         * middlewares in declaration order, whatever the call order relative to
         * nested() and the handler methods.
         */
        c_router& middlewares(middleware::middlewares_t middlewares);

        /**
         * @brief Set the handler for @p method.
         *
         * Setting a specific method drops `all`; setting `all` drops every specific method.
         *
         * @throws exceptions::route_exception_t for a null handler or an unknown method.
         */
        c_router& handle(const http::e_method& method, handler_t handler);

        template <typename _fn_t>
        ROUTEKIT_INLINE c_router& get(_fn_t&& fn) { return handle(http::e_method::get, make_handler(std::forward<_fn_t>(fn))); }

        template <typename _fn_t>
        ROUTEKIT_INLINE c_router& post(_fn_t&& fn) { return handle(http::e_method::post, make_handler(std::forward<_fn_t>(fn))); }

        template <typename _fn_t>
        ROUTEKIT_INLINE c_router& put(_fn_t&& fn) { return handle(http::e_method::put, make_handler(std::forward<_fn_t>(fn))); }

        template <typename _fn_t>
        ROUTEKIT_INLINE c_router& patch(_fn_t&& fn) { return handle(http::e_method::patch, make_handler(std::forward<_fn_t>(fn))); }

        template <typename _fn_t>
        ROUTEKIT_INLINE c_router& delete_(_fn_t&& fn) { return handle(http::e_method::delete_, make_handler(std::forward<_fn_t>(fn))); }

        template <typename _fn_t>
        ROUTEKIT_INLINE c_router& head(_fn_t&& fn) { return handle(http::e_method::head, make_handler(std::forward<_fn_t>(fn))); }

        template <typename _fn_t>
        ROUTEKIT_INLINE c_router& options(_fn_t&& fn) { return handle(http::e_method::options, make_handler(std::forward<_fn_t>(fn))); }

        template <typename _fn_t>
        ROUTEKIT_INLINE c_router& all(_fn_t&& fn) { return handle(http::e_method::all, make_handler(std::forward<_fn_t>(fn))); }

        /**
         * @brief Rebuild the tables of this subtree bottom-up and re-propagate to the ancestors.
         *
         * Mutators already keep tables current; rerunning on an unchanged tree
         * leaves every table identical.
         */
        void compose();

      public:
        /**
         * @brief Owning handle to this router; it must have been created through route::path().
         */
        ROUTEKIT_INLINE ptr_t self() { return shared_from_this(); }

        [[nodiscard]] ROUTEKIT_INLINE const auto& parsed() const { return m_parsed; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& declared_path() const { return m_parsed.m_template; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& url_path() const { return m_parsed.m_url_path; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& query_path() const { return m_parsed.m_query_path; }

        [[nodiscard]] ROUTEKIT_INLINE const c_router* parent() const { return m_parent; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& children() const { return m_children; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& middlewares() const { return m_middlewares; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& handlers() const { return m_handlers; }

        [[nodiscard]] ROUTEKIT_INLINE const auto& routes() const { return m_routes; }

        [[nodiscard]] ROUTEKIT_INLINE bool has_handlers() const { return !m_handlers.empty(); }

        /**
         * @brief The entry this router would contribute for itself to a parentless table.
         *
         * Used for the root's own handlers, which have no ancestor table to live in.
         */
        [[nodiscard]] route_entry_t own_entry() const;

      private:
        /**
         * @brief Walk every ancestor, each absorbing the previous node of the walk.
         */
        void propagate();

        /**
         * @brief Re-derive this router's table from its children.
         */
        void rebuild();

        void rebuild_subtree();

        /**
         * @brief Materialize @p descendant (its handlers and its table) into this router's table.
         */
        void absorb(const c_router& descendant);

        void store(const std::string& key, route_entry_t&& entry);

      private:
        /** @brief Parsed path template. */
        path::parsed_path_t m_parsed{};

        /** @brief Non-owning back-reference, null for a root. */
        c_router* m_parent{};

        /** @brief Owned children, in attach order. */
        std::vector<ptr_t> m_children{};

        /** @brief Middlewares declared on this router. */
        middleware::middlewares_t m_middlewares{};

        /** @brief Handlers declared on this router. */
        handlers_t m_handlers{};

        /** @brief Entries of every descendant with handlers. */
        routes_t m_routes{};
    };
}

#endif // ROUTEKIT_ROUTE_HXX
