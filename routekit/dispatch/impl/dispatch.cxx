#include <routekit.hxx>

namespace routekit::dispatch {
    namespace {
        std::optional<http::value_t> coerce_as(const path::e_param_type& type, const std::string_view& raw) {
            switch (type) {
                case path::e_param_type::string:
                case path::e_param_type::regex:
                    return http::value_t{std::string{raw}};
                case path::e_param_type::number: {
                    std::int64_t value{};

                    const auto [end, error] = std::from_chars(raw.data(), raw.data() + raw.size(), value);

                    if (error != std::errc{} || end != raw.data() + raw.size())
                        return std::nullopt;

                    return http::value_t{value};
                }
                case path::e_param_type::boolean:
                    if (raw == "true")
                        return http::value_t{true};

                    if (raw == "false")
                        return http::value_t{false};

                    return std::nullopt;
            }

            return std::nullopt;
        }

        std::vector<std::string> raw_values(const std::vector<std::string>& values, const bool split) {
            if (!split)
                return values;

            std::vector<std::string> result{};

            for (const auto& value : values) {
                std::vector<std::string> parts{};

                boost::split(parts, value, boost::is_any_of(","));

                for (auto& part : parts) {
                    boost::trim(part);

                    if (!part.empty())
                        result.push_back(std::move(part));
                }
            }

            return result;
        }
    }

    log_sink_t default_log_sink() {
        return []([[maybe_unused]] const request_log_t& event) {
#ifdef ROUTEKIT_USE_LOGGING_IMPL
            g_logging->log(e_log_level::info, "[Dispatch] {} {} {:.3f}ms", event.m_method, event.m_path, event.m_elapsed_ms);
#endif // ROUTEKIT_USE_LOGGING_IMPL
        };
    }

    std::optional<http::value_t> coerce(const path::param_descriptor_t& descriptor, const std::string_view& raw) {
        if (raw.empty())
            return std::nullopt;

        if (descriptor.m_regex.has_value() && !std::regex_search(raw.begin(), raw.end(), descriptor.m_regex.value()))
            return std::nullopt;

        const auto& allowed = descriptor.m_enum_values;

        if (!allowed.empty()) {
            if (std::find(allowed.begin(), allowed.end(), raw) != allowed.end())
                return http::value_t{std::string{raw}};

            for (const auto& type : descriptor.m_types) {
                if (type == path::e_param_type::string || type == path::e_param_type::regex)
                    continue;

                if (auto value = coerce_as(type, raw); value.has_value())
                    return value;
            }

            return std::nullopt;
        }

        for (const auto& type : descriptor.m_types) {
            if (auto value = coerce_as(type, raw); value.has_value())
                return value;
        }

        return std::nullopt;
    }

    http::values_t coerce_params(const path::params_t& descriptors, const http::params_t& raw) {
        http::values_t values{};

        for (const auto& [name, descriptor] : descriptors) {
            const auto it = raw.find(name);

            if (it == raw.end())
                continue;

            if (auto value = coerce(descriptor, it->second); value.has_value())
                values.emplace(name, std::move(value.value()));
        }

        return values;
    }

    query_result_t coerce_query(const path::params_t& descriptors, const http::query_t& raw, const bool split) {
        query_result_t result{};

        for (const auto& [name, descriptor] : descriptors) {
            std::vector<http::value_t> values{};

            if (const auto it = raw.find(name); it != raw.end() && !it->second.empty()) {
                if (descriptor.m_is_array) {
                    for (const auto& value : raw_values(it->second, split)) {
                        if (auto coerced = coerce(descriptor, value); coerced.has_value())
                            values.push_back(std::move(coerced.value()));
                    }
                }
                else if (auto coerced = coerce(descriptor, it->second.front()); coerced.has_value())
                    values.push_back(std::move(coerced.value()));
            }

            if (values.empty()) {
                if (!descriptor.m_is_optional)
                    result.m_missing.push_back(name);

                continue;
            }

            result.m_values.emplace(name, std::move(values));
        }

        return result;
    }

    const middleware::next_t* compiled_route_t::chain_for(const http::e_method& method) const {
        if (const auto it = m_chains.find(method); it != m_chains.end())
            return &it->second;

        if (const auto it = m_chains.find(http::e_method::all); it != m_chains.end())
            return &it->second;

        return nullptr;
    }

    std::string compiled_route_t::allowed() const {
        std::vector<std::string_view> methods{};

        for (const auto& [method, handler] : m_entry.m_handlers)
            methods.push_back(http::method_to_str(method));

        return fmt::format("{}", fmt::join(methods, ", "));
    }

    void c_dispatcher::mount(const route::c_router& root) {
        m_routes.clear();
        m_matcher = {};

        if (root.has_handlers())
            compile(root.own_entry());

        for (const auto& [key, entry] : root.routes())
            compile(entry);

#ifdef ROUTEKIT_USE_LOGGING_IMPL
        g_logging->log(e_log_level::debug, "[Dispatch] Mounted {} routes from '{}'", m_routes.size(), root.declared_path());
#endif // ROUTEKIT_USE_LOGGING_IMPL
    }

    void c_dispatcher::compile(route::route_entry_t entry) {
        compiled_route_t compiled{};

        for (const auto& [method, handler] : entry.m_handlers) {
            middleware::next_t terminal = [handler](http::http_ctx_t& ctx) {
                return handler->handle_async(ctx);
            };

            compiled.m_chains.emplace(method, middleware::build_chain(entry.m_middlewares, std::move(terminal)));
        }

        const auto key = entry.m_full_url_path;

        const auto existing = m_routes.find(key);
        [[maybe_unused]] const auto replaced = existing != m_routes.end();
        [[maybe_unused]] const auto other_origin = replaced && existing->second.m_entry.m_origin != entry.m_origin;

        [[maybe_unused]] const auto fresh_shape = m_matcher.insert(entry.m_segments, key);

#ifdef ROUTEKIT_USE_LOGGING_IMPL
        if (other_origin)
            g_logging->log(
                e_log_level::warning,
                "[Dispatch] Route '{}' is declared by more than one router, the latest declaration wins",
                key
            );
        else if (!replaced && !fresh_shape)
            g_logging->log(e_log_level::warning, "[Dispatch] Route '{}' shadows an earlier route with the same shape", key);
#endif // ROUTEKIT_USE_LOGGING_IMPL

        compiled.m_entry = std::move(entry);

        m_routes.insert_or_assign(key, std::move(compiled));
    }

    const compiled_route_t* c_dispatcher::find(const std::string& key) const {
        const auto it = m_routes.find(key);

        return it != m_routes.end() ? &it->second : nullptr;
    }

    std::optional<match_t> c_dispatcher::match(const std::string_view& path) const {
        const auto normalized = m_cfg.m_ignore_trailing_slash ? http::utils::trim_trailing_slash(path) : path;

        auto hit = m_matcher.find(normalized);

        if (!hit.has_value())
            return std::nullopt;

        auto& [key, captured] = hit.value();

        const auto route = find(key);

        if (!route)
            return std::nullopt;

        match_t result{key, {}};

        std::size_t index{};

        for (const auto& segment : route->m_entry.m_segments) {
            if (!segment.m_is_param || index >= captured.size())
                continue;

            result.m_params.insert_or_assign(segment.m_text, std::move(captured[index++]));
        }

        return result;
    }

    boost::asio::awaitable<http::response_t> c_dispatcher::dispatch(http::request_t request) const {
        const auto started = std::chrono::steady_clock::now();

        const compiled_route_t* route{};

        if (!request.route().empty())
            route = find(request.route());
        else if (auto matched = match(request.path()); matched.has_value()) {
            route = find(matched->m_key);

            for (auto& [name, value] : matched->m_params)
                request.params().try_emplace(name, std::move(value));
        }

        if (!route) {
            emit(request, started);

            co_return http::response_t("Not Found", http::e_status::not_found);
        }

        const auto chain = route->chain_for(request.method());

        if (!chain) {
            emit(request, started);

            http::headers_t headers{};

            headers.emplace("Allow", route->allowed());

            co_return http::response_t("Method Not Allowed", http::e_status::method_not_allowed, std::move(headers));
        }

        auto params = coerce_params(route->m_entry.m_path_params, request.params());
        auto query = coerce_query(route->m_entry.m_query_params, request.query(), m_cfg.m_split_query_arrays);

        http::http_ctx_t ctx{std::move(request), std::move(params), std::move(query.m_values)};

        ctx.missing_query() = std::move(query.m_missing);

        auto response = co_await (*chain)(ctx);

        emit(ctx.request(), started);

        co_return response;
    }

    std::function<boost::asio::awaitable<http::response_t>(http::request_t)> c_dispatcher::handler_for(std::string key) const {
        return [this, key = std::move(key)](http::request_t request) {
            request.route() = key;

            return dispatch(std::move(request));
        };
    }

    void c_dispatcher::emit(const http::request_t& request, const std::chrono::steady_clock::time_point& started) const {
        if (!m_log_sink)
            return;

        const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - started;

        m_log_sink(request_log_t{std::string{http::method_to_str(request.method())}, request.path(), elapsed.count()});
    }
}
