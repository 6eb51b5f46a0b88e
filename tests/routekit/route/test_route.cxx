#include <gtest/gtest.h>

#include <routekit.hxx>

using namespace routekit::route;
using namespace routekit::http;

using routekit::exceptions::route_exception_t;
using routekit::middleware::c_base_middleware;
using routekit::middleware::make_middleware;
using routekit::middleware::middleware_t;

namespace {
    class pass_middleware : public c_base_middleware {
      public:
        boost::asio::awaitable<response_t> run(http_ctx_t& ctx) override {
            co_return co_await next(ctx);
        }
    };

    middleware_t named(const std::string& name) {
        return make_middleware<pass_middleware>(name);
    }

    std::vector<std::string> names(const routekit::middleware::middlewares_t& middlewares) {
        std::vector<std::string> result{};

        for (const auto& middleware : middlewares)
            result.push_back(middleware.m_name);

        return result;
    }

    response_t ok_handler(http_ctx_t&) {
        return response_t("ok");
    }
}

TEST(RouteTest, SyncHandlerExecution) {
    auto handler = make_handler([](http_ctx_t& ctx) -> response_t {
        return response_t("Hello", e_status::ok);
    });

    EXPECT_FALSE(handler->is_async());

    boost::asio::io_context io_context;

    auto future = boost::asio::co_spawn(
        io_context,

        [&]() -> boost::asio::awaitable<void> {
            http_ctx_t ctx;

            auto response = co_await handler->handle_async(ctx);

            EXPECT_EQ(response.body(), "Hello");
            EXPECT_EQ(response.status(), e_status::ok);

            co_return;
        },

        boost::asio::use_future
    );

    io_context.run();
    future.get();
}

TEST(RouteTest, AsyncHandlerExecution) {
    auto handler = make_handler([](http_ctx_t& ctx) -> boost::asio::awaitable<response_t> {
        co_return response_t("Async", e_status::created);
    });

    EXPECT_TRUE(handler->is_async());

    boost::asio::io_context io_context;

    auto future = boost::asio::co_spawn(
        io_context,

        [&]() -> boost::asio::awaitable<void> {
            http_ctx_t ctx;

            auto response = co_await handler->handle_async(ctx);

            EXPECT_EQ(response.body(), "Async");
            EXPECT_EQ(response.status(), e_status::created);

            co_return;
        },

        boost::asio::use_future
    );

    io_context.run();
    future.get();
}

TEST(RouteTest, SpecificMethodReplacesAll) {
    auto h1 = make_handler(&ok_handler);
    auto h2 = make_handler(&ok_handler);

    auto node = path("/a");

    node->get(h1).all(h2);

    ASSERT_EQ(node->handlers().size(), 1);
    EXPECT_EQ(node->handlers().at(e_method::all), h2);

    auto other = path("/b");

    other->all(h2).get(h1);

    ASSERT_EQ(other->handlers().size(), 1);
    EXPECT_EQ(other->handlers().at(e_method::get), h1);
}

TEST(RouteTest, SpecificMethodsAccumulate) {
    auto node = path("/a");

    node->get(&ok_handler).post(&ok_handler).delete_(&ok_handler);

    EXPECT_EQ(node->handlers().size(), 3);
    EXPECT_TRUE(node->handlers().contains(e_method::delete_));
}

TEST(RouteTest, NestedChildAppearsInParentTable) {
    auto root = path("");
    auto child = path("/a");

    child->get(&ok_handler);

    root->nested({child});

    ASSERT_TRUE(root->routes().contains("/a"));

    const auto& entry = root->routes().at("/a");

    EXPECT_TRUE(entry.m_handlers.contains(e_method::get));
    EXPECT_TRUE(entry.m_middlewares.empty());
    EXPECT_EQ(entry.m_origin, child.get());
    EXPECT_EQ(child->parent(), root.get());
}

TEST(RouteTest, HandlerAddedAfterNestingPropagates) {
    auto root = path("");
    auto child = path("/a");

    root->nested({child});

    EXPECT_TRUE(root->routes().empty());

    child->post(&ok_handler);

    ASSERT_TRUE(root->routes().contains("/a"));
    EXPECT_TRUE(root->routes().at("/a").m_handlers.contains(e_method::post));
}

TEST(RouteTest, MiddlewareAddedAfterNestingIsRetrofitted) {
    auto root = path("");
    auto child = path("/a");

    child->get(&ok_handler);

    root->nested({child});
    root->middlewares({named("M1")});

    EXPECT_EQ(names(root->routes().at("/a").m_middlewares), std::vector<std::string>{"M1"});
}

TEST(RouteTest, ThreeLevelMiddlewareOrder) {
    auto root = path("");
    auto mid = path("/m");
    auto leaf = path("/l");

    root->middlewares({named("R")});
    mid->middlewares({named("M")});

    root->nested({mid});
    mid->nested({leaf});

    leaf->get(&ok_handler).middlewares({named("L")});

    EXPECT_EQ(names(root->routes().at("/m/l").m_middlewares), (std::vector<std::string>{"R", "M", "L"}));
    EXPECT_EQ(names(mid->routes().at("/l").m_middlewares), (std::vector<std::string>{"M", "L"}));
}

TEST(RouteTest, MiddlewareOrderIndependentOfDeclarationOrder) {
    auto build = [](bool middlewares_first) {
        auto root = path("");
        auto mid = path("/m");
        auto leaf = path("/l");

        leaf->get(&ok_handler);

        if (middlewares_first) {
            root->middlewares({named("R")});
            mid->middlewares({named("M1")});
            mid->middlewares({named("M2")});
            root->nested({mid});
            mid->nested({leaf});
        }
        else {
            mid->nested({leaf});
            root->nested({mid});
            mid->middlewares({named("M1")});
            root->middlewares({named("R")});
            mid->middlewares({named("M2")});
        }

        return names(root->routes().at("/m/l").m_middlewares);
    };

    EXPECT_EQ(build(true), (std::vector<std::string>{"R", "M1", "M2"}));
    EXPECT_EQ(build(false), (std::vector<std::string>{"R", "M1", "M2"}));
}

TEST(RouteTest, EntryMergesParamsAndSegments) {
    auto root = path("/users/<id: number>?fields=string[]");
    auto posts = path("/posts/<post>?page=number?");

    posts->get(&ok_handler);

    root->nested({posts});

    const auto& entry = root->routes().at("/posts/<post>");

    EXPECT_EQ(entry.m_full_url_path, "/users/<id: number>/posts/<post>");
    EXPECT_EQ(entry.m_full_query_path, "fields=string[]&page=number?");
    EXPECT_TRUE(entry.m_path_params.contains("id"));
    EXPECT_TRUE(entry.m_path_params.contains("post"));
    EXPECT_TRUE(entry.m_query_params.contains("fields"));
    EXPECT_TRUE(entry.m_query_params.contains("page"));

    ASSERT_EQ(entry.m_segments.size(), 4);
    EXPECT_EQ(entry.m_segments[0], (routekit::path::segment_t{"users", false}));
    EXPECT_EQ(entry.m_segments[1], (routekit::path::segment_t{"id", true}));
    EXPECT_EQ(entry.m_segments[3], (routekit::path::segment_t{"post", true}));
}

TEST(RouteTest, BuilderFormOfNested) {
    auto root = path("/api");

    root->nested([](const c_router::factory_t& route) {
        auto users = route("/users");

        users->get(&ok_handler);

        return std::vector<c_router::ptr_t>{users, route("/health")->get(&ok_handler).self()};
    });

    EXPECT_EQ(root->children().size(), 2);
    EXPECT_TRUE(root->routes().contains("/users"));
    EXPECT_TRUE(root->routes().contains("/health"));
    EXPECT_FALSE(root->routes().contains("/api/users"));
    EXPECT_EQ(root->routes().at("/users").m_full_url_path, "/api/users");
}

TEST(RouteTest, TablesAreKeyedBelowTheirOwner) {
    auto root = path("/api");
    auto mid = path("/m/<id: number>");
    auto leaf = path("/l");

    root->nested({mid});
    mid->nested({leaf});

    leaf->get(&ok_handler);

    ASSERT_TRUE(mid->routes().contains("/l"));
    EXPECT_EQ(mid->routes().at("/l").m_full_url_path, "/m/<id: number>/l");

    ASSERT_TRUE(root->routes().contains("/m/<id: number>/l"));

    const auto& entry = root->routes().at("/m/<id: number>/l");

    EXPECT_EQ(entry.m_full_url_path, "/api/m/<id: number>/l");
    EXPECT_EQ(entry.m_segments.size(), 4);
    EXPECT_TRUE(entry.m_path_params.contains("id"));
    EXPECT_EQ(entry.m_origin, leaf.get());
}

TEST(RouteTest, ComposeIsIdempotent) {
    auto root = path("");
    auto mid = path("/m/<id: number>");
    auto leaf = path("/l?q=string?");

    leaf->get(&ok_handler);
    mid->all(&ok_handler);

    root->nested({mid});
    mid->nested({leaf});
    root->middlewares({named("R")});

    const auto before_root = root->routes();
    const auto before_mid = mid->routes();

    root->compose();
    root->compose();

    EXPECT_EQ(root->routes(), before_root);
    EXPECT_EQ(mid->routes(), before_mid);
}

TEST(RouteTest, RedeclaredMiddlewareWithSameNameChangesEntry) {
    auto build = [](const middleware_t& middleware) {
        auto root = path("");
        auto child = path("/a");

        child->get(&ok_handler);

        root->nested({child});
        root->middlewares({middleware});

        return root->routes().at("/a").m_middlewares;
    };

    const auto auth = named("auth");

    EXPECT_EQ(build(auth), build(auth));
    EXPECT_NE(build(auth), build(named("auth")));
}

TEST(RouteTest, LaterDeclarationWinsOnSameKey) {
    auto root = path("");
    auto first = path("/dup");
    auto second = path("/dup");

    auto h1 = make_handler(&ok_handler);
    auto h2 = make_handler(&ok_handler);

    first->get(h1);
    second->get(h2);

    root->nested({first, second});

    EXPECT_EQ(root->routes().at("/dup").m_handlers.at(e_method::get), h2);
}

TEST(RouteTest, StructuralMisuseThrows) {
    auto root = path("");
    auto child = path("/a");
    auto grandchild = path("/b");

    root->nested({child});
    child->nested({grandchild});

    EXPECT_THROW(path("")->nested({child}), route_exception_t);
    EXPECT_THROW(root->nested({root}), route_exception_t);
    EXPECT_THROW(grandchild->nested({root}), route_exception_t);
    EXPECT_THROW(root->nested({nullptr}), route_exception_t);
    EXPECT_THROW(root->handle(e_method::get, nullptr), route_exception_t);
}
