#include <routekit.hxx>

namespace routekit {
    void c_routekit::start(routekit_cfg_t cfg) {
        m_cfg = std::move(cfg);

#ifdef ROUTEKIT_USE_LOGGING_IMPL
        g_logging->init(
            m_cfg.m_logger.m_level,
            m_cfg.m_logger.m_force_flush,
            m_cfg.m_logger.m_async,
            m_cfg.m_logger.m_buffer_size,
            m_cfg.m_logger.m_strategy
        );
#endif // ROUTEKIT_USE_LOGGING_IMPL

        m_root->compose();

        dispatch::c_dispatcher dispatcher{m_cfg.m_dispatch};

        dispatcher.mount(*m_root);

        m_dispatcher = std::move(dispatcher);

        m_running.store(true, std::memory_order_release);

#ifdef ROUTEKIT_USE_LOGGING_IMPL
        g_logging->log(e_log_level::info, "[Core] Serving {} routes", m_dispatcher.routes().size());
#endif // ROUTEKIT_USE_LOGGING_IMPL
    }

    void c_routekit::stop() {
        if (!m_running)
            return;

        m_running.store(false, std::memory_order_release);

#ifdef ROUTEKIT_USE_LOGGING_IMPL
        g_logging->log(e_log_level::info, "[Core] Stopped");

        g_logging->stop_async();
#endif // ROUTEKIT_USE_LOGGING_IMPL
    }

    void c_routekit::load(adapter::c_base_adapter& adapter) {
        if (!m_running.load(std::memory_order_acquire))
            throw base_exception_t("Can't load routes into a transport before start()");

        auto routes = adapter.translate(m_dispatcher);

#ifdef ROUTEKIT_USE_LOGGING_IMPL
        for (const auto& route : routes)
            g_logging->log(e_log_level::debug, "[Core] Loading {} {}", http::method_to_str(route.m_method), route.m_path);
#endif // ROUTEKIT_USE_LOGGING_IMPL

        adapter.initialize(std::move(routes));
    }

    boost::asio::awaitable<http::response_t> c_routekit::handle(http::request_t request) {
        if (!m_running.load(std::memory_order_acquire))
            throw base_exception_t("Can't handle requests before start()");

        co_return co_await m_dispatcher.dispatch(std::move(request));
    }
}
