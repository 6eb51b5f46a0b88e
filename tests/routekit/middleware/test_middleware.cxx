#include <gtest/gtest.h>

#include <routekit.hxx>

using namespace routekit::middleware;
using namespace routekit::http;

using routekit::exceptions::middleware_init_exception_t;

namespace {
    using trace_t = std::shared_ptr<std::vector<std::string>>;

    class trace_middleware : public c_base_middleware {
      public:
        trace_middleware(trace_t trace, std::string tag)
            : m_trace(std::move(trace)), m_tag(std::move(tag)) {}

        boost::asio::awaitable<response_t> run(http_ctx_t& ctx) override {
            m_trace->push_back(m_tag + ">");

            auto response = co_await next(ctx);

            m_trace->push_back("<" + m_tag);

            response.headers()["X-" + m_tag] = "seen";

            co_return response;
        }

      private:
        trace_t m_trace;

        std::string m_tag;
    };

    class terminating_middleware : public c_base_middleware {
      public:
        boost::asio::awaitable<response_t> run(http_ctx_t& ctx) override {
            co_return response_t("Unauthorized", e_status::unauthorized);
        }
    };

    class failing_init_middleware : public c_base_middleware {
      public:
        void init(next_t next) override {
            throw std::runtime_error("missing secret");
        }

        boost::asio::awaitable<response_t> run(http_ctx_t& ctx) override {
            co_return co_await next(ctx);
        }
    };

    class failing_ctor_middleware : public c_base_middleware {
      public:
        failing_ctor_middleware() {
            throw std::runtime_error("no connection");
        }

        boost::asio::awaitable<response_t> run(http_ctx_t& ctx) override {
            co_return co_await next(ctx);
        }
    };

    next_t terminal(trace_t trace) {
        return [trace](http_ctx_t& ctx) -> boost::asio::awaitable<response_t> {
            trace->push_back("handler");

            co_return response_t("done");
        };
    }

    response_t run_chain(const next_t& chain) {
        boost::asio::io_context io_context;

        auto future = boost::asio::co_spawn(
            io_context,

            [&]() -> boost::asio::awaitable<response_t> {
                http_ctx_t ctx;

                co_return co_await chain(ctx);
            },

            boost::asio::use_future
        );

        io_context.run();

        return future.get();
    }
}

TEST(MiddlewareTest, EmptyChainIsTerminal) {
    auto trace = std::make_shared<std::vector<std::string>>();

    auto chain = build_chain({}, terminal(trace));

    auto response = run_chain(chain);

    EXPECT_EQ(response.body(), "done");
    EXPECT_EQ(*trace, std::vector<std::string>{"handler"});
}

TEST(MiddlewareTest, ChainRunsOutermostFirst) {
    auto trace = std::make_shared<std::vector<std::string>>();

    auto chain = build_chain(
        {make_middleware<trace_middleware>("a", trace, std::string{"A"}), make_middleware<trace_middleware>("b", trace, std::string{"B"})},
        terminal(trace)
    );

    auto response = run_chain(chain);

    EXPECT_EQ(response.body(), "done");
    EXPECT_EQ(response.headers().at("X-A"), "seen");
    EXPECT_EQ(response.headers().at("X-B"), "seen");
    EXPECT_EQ(*trace, (std::vector<std::string>{"A>", "B>", "handler", "<B", "<A"}));
}

TEST(MiddlewareTest, MiddlewareCanShortCircuit) {
    auto trace = std::make_shared<std::vector<std::string>>();

    auto chain = build_chain(
        {make_middleware<trace_middleware>("a", trace, std::string{"A"}), make_middleware<terminating_middleware>("auth")},
        terminal(trace)
    );

    auto response = run_chain(chain);

    EXPECT_EQ(response.status(), e_status::unauthorized);
    EXPECT_EQ(*trace, (std::vector<std::string>{"A>", "<A"}));
}

TEST(MiddlewareTest, InstancesAreReusedAcrossRequests) {
    auto created = std::make_shared<int>(0);

    middleware_t counting{
        "counting",

        [created]() -> instance_t {
            ++*created;

            return std::make_shared<trace_middleware>(std::make_shared<std::vector<std::string>>(), "C");
        }
    };

    auto trace = std::make_shared<std::vector<std::string>>();

    auto chain = build_chain({counting}, terminal(trace));

    run_chain(chain);
    run_chain(chain);

    EXPECT_EQ(*created, 1);
    EXPECT_EQ(trace->size(), 2);
}

TEST(MiddlewareTest, InitFailureIsReported) {
    auto trace = std::make_shared<std::vector<std::string>>();

    try {
        build_chain({make_middleware<trace_middleware>("a", trace, std::string{"A"}), make_middleware<failing_init_middleware>("secret")}, terminal(trace));

        FAIL() << "expected middleware_init_exception_t";
    }
    catch (const middleware_init_exception_t& e) {
        EXPECT_EQ(e.middleware(), "secret");
        EXPECT_EQ(e.prefix(), "Middleware-Init");
        EXPECT_NE(e.message().find("missing secret"), std::string::npos);
    }
}

TEST(MiddlewareTest, ConstructionFailureIsReported) {
    auto trace = std::make_shared<std::vector<std::string>>();

    try {
        build_chain({make_middleware<failing_ctor_middleware>("db")}, terminal(trace));

        FAIL() << "expected middleware_init_exception_t";
    }
    catch (const middleware_init_exception_t& e) {
        EXPECT_EQ(e.middleware(), "db");
        EXPECT_NE(e.message().find("no connection"), std::string::npos);
    }
}

TEST(MiddlewareTest, MissingFactoryIsReported) {
    auto trace = std::make_shared<std::vector<std::string>>();

    EXPECT_THROW(build_chain({middleware_t{"empty", {}}}, terminal(trace)), middleware_init_exception_t);
}

TEST(MiddlewareTest, DescriptorsCompareByDeclaration) {
    auto trace = std::make_shared<std::vector<std::string>>();

    const auto first = make_middleware<trace_middleware>("trace", trace, std::string{"A"});
    const auto copy = first;
    const auto second = make_middleware<trace_middleware>("trace", trace, std::string{"B"});

    EXPECT_EQ(copy, first);
    EXPECT_NE(second, first);
    EXPECT_NE(second.m_id, first.m_id);
}
