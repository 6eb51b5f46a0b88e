#include <routekit.hxx>

namespace routekit::middleware {
    namespace {
        ROUTEKIT_INLINE instance_t instantiate(const middleware_t& middleware) {
            if (!middleware.m_factory)
                throw exceptions::middleware_init_exception_t(middleware.m_name, "no factory");

            try {
                auto instance = middleware.m_factory();

                if (!instance)
                    throw exceptions::middleware_init_exception_t(middleware.m_name, "factory returned no instance");

                return instance;
            }
            catch (const exceptions::middleware_init_exception_t&) {
                throw;
            }
            catch (const std::exception& e) {
                throw exceptions::middleware_init_exception_t(middleware.m_name, e.what());
            }
        }

        ROUTEKIT_INLINE void init(const middleware_t& middleware, const instance_t& instance, next_t next) {
            try {
                instance->init(std::move(next));
            }
            catch (const exceptions::middleware_init_exception_t&) {
                throw;
            }
            catch (const std::exception& e) {
                throw exceptions::middleware_init_exception_t(middleware.m_name, e.what());
            }
        }

        ROUTEKIT_INLINE next_t bind_run(instance_t instance) {
            return [instance = std::move(instance)](http::http_ctx_t& ctx) {
                return instance->run(ctx);
            };
        }
    }

    next_t build_chain(const middlewares_t& middlewares, next_t terminal) {
        if (middlewares.empty())
            return terminal;

        auto previous = instantiate(middlewares.front());

        auto chain = bind_run(previous);

        for (std::size_t i = 1u; i < middlewares.size(); i++) {
            auto current = instantiate(middlewares[i]);

            init(middlewares[i - 1u], previous, bind_run(current));

            previous = std::move(current);
        }

        init(middlewares.back(), previous, std::move(terminal));

        return chain;
    }
}
