#include <gtest/gtest.h>

#include <routekit.hxx>

using namespace routekit;
using namespace routekit::http;

namespace {
    /**
     * @brief Adapter speaking the ":name" parameter syntax and keeping what it was given.
     */
    class colon_adapter : public adapter::c_base_adapter {
      public:
        std::string translate_path_parameter(const std::string& name, const path::param_descriptor_t& descriptor) const override {
            return ":" + name;
        }

        void initialize(adapter::loaded_routes_t routes) override {
            m_routes = std::move(routes);
        }

      public:
        adapter::loaded_routes_t m_routes{};
    };

    class silent_adapter : public adapter::c_base_adapter {};

    routekit_cfg_t quiet_cfg() {
        routekit_cfg_t cfg{};

#ifdef ROUTEKIT_HAS_LOGGING_IMPL
        cfg.m_logger.m_level = e_log_level::none;
        cfg.m_logger.m_async = false;
#endif

        return cfg;
    }

    void declare_routes(c_routekit& app) {
        auto users = route::nested("/users");
        auto user = route::nested("/<id: number>");

        users->get([](http_ctx_t&) { return response_t("list"); });
        user->get([](http_ctx_t& ctx) { return response_t(fmt::format("user {}", ctx.param<std::int64_t>("id").value_or(-1))); })
            .delete_([](http_ctx_t&) { return response_t("", e_status::no_content); });

        app.root().nested({users});
        users->nested({user});
    }

    response_t run(c_routekit& app, request_t request) {
        boost::asio::io_context io_context;

        auto future = boost::asio::co_spawn(io_context, app.handle(std::move(request)), boost::asio::use_future);

        io_context.run();

        return future.get();
    }
}

TEST(RoutekitTest, StartMountsDeclaredRoutes) {
    c_routekit app;

    declare_routes(app);

    app.start(quiet_cfg());

    EXPECT_TRUE(app.running());
    EXPECT_EQ(app.dispatcher().routes().size(), 2);

    EXPECT_EQ(run(app, {e_method::get, "/users/3"}).body(), "user 3");
    EXPECT_EQ(run(app, {e_method::get, "/users"}).body(), "list");

    app.stop();

    EXPECT_FALSE(app.running());
}

TEST(RoutekitTest, HandleBeforeStartThrows) {
    c_routekit app;

    EXPECT_THROW(run(app, {e_method::get, "/"}), base_exception_t);
}

TEST(RoutekitTest, LoadTranslatesRoutesForAdapter) {
    c_routekit app;

    declare_routes(app);

    app.start(quiet_cfg());

    colon_adapter transport;

    app.load(transport);

    ASSERT_EQ(transport.m_routes.size(), 3);

    EXPECT_EQ(transport.m_routes[0].m_path, "/users");
    EXPECT_EQ(transport.m_routes[0].m_method, e_method::get);

    EXPECT_EQ(transport.m_routes[1].m_path, "/users/:id");
    EXPECT_EQ(transport.m_routes[1].m_method, e_method::get);
    EXPECT_EQ(transport.m_routes[1].m_key, "/users/<id: number>");

    EXPECT_EQ(transport.m_routes[2].m_path, "/users/:id");
    EXPECT_EQ(transport.m_routes[2].m_method, e_method::delete_);

    request_t request{e_method::get, "/users/42"};

    request.params()["id"] = "42";

    boost::asio::io_context io_context;

    auto future = boost::asio::co_spawn(io_context, transport.m_routes[1].m_handler(std::move(request)), boost::asio::use_future);

    io_context.run();

    EXPECT_EQ(future.get().body(), "user 42");

    app.stop();
}

TEST(RoutekitTest, RootPathTranslatesToSlash) {
    colon_adapter transport;

    EXPECT_EQ(transport.translate_path({}, {}), "/");
}

TEST(RoutekitTest, DefaultAdapterMethodsThrow) {
    silent_adapter transport;

    try {
        transport.translate_path_parameter("id", {});

        FAIL() << "expected unimplemented_collaborator_exception_t";
    }
    catch (const exceptions::unimplemented_collaborator_exception_t& e) {
        EXPECT_EQ(e.method(), "translate_path_parameter");
        EXPECT_EQ(e.prefix(), "Collaborator");
    }

    EXPECT_THROW(transport.initialize({}), exceptions::unimplemented_collaborator_exception_t);
}

TEST(RoutekitTest, LoadWithIncompleteAdapterThrows) {
    c_routekit app;

    declare_routes(app);

    app.start(quiet_cfg());

    silent_adapter transport;

    EXPECT_THROW(app.load(transport), exceptions::unimplemented_collaborator_exception_t);

    app.stop();
}

TEST(RoutekitTest, LoadBeforeStartThrows) {
    c_routekit app;

    colon_adapter transport;

    EXPECT_THROW(app.load(transport), base_exception_t);
}
