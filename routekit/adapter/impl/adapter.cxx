#include <routekit.hxx>

namespace routekit::adapter {
    std::string c_base_adapter::translate_path_parameter(
        [[maybe_unused]] const std::string& name,
        [[maybe_unused]] const path::param_descriptor_t& descriptor
    ) const {
        throw exceptions::unimplemented_collaborator_exception_t("translate_path_parameter");
    }

    void c_base_adapter::initialize([[maybe_unused]] loaded_routes_t routes) {
        throw exceptions::unimplemented_collaborator_exception_t("initialize");
    }

    std::string c_base_adapter::translate_path(const path::segments_t& segments, const path::params_t& params) const {
        if (segments.empty())
            return "/";

        std::string result{};

        for (const auto& segment : segments) {
            result += '/';

            if (!segment.m_is_param) {
                result += segment.m_text;

                continue;
            }

            const auto it = params.find(segment.m_text);

            if (it == params.end())
                throw exceptions::route_exception_t(fmt::format("No descriptor for path parameter '{}'", segment.m_text));

            result += translate_path_parameter(segment.m_text, it->second);
        }

        return result;
    }

    loaded_routes_t c_base_adapter::translate(const dispatch::c_dispatcher& dispatcher) const {
        loaded_routes_t routes{};

        for (const auto& [key, compiled] : dispatcher.routes()) {
            const auto& entry = compiled.m_entry;

            const auto translated = translate_path(entry.m_segments, entry.m_path_params);

            for (const auto& [method, handler] : entry.m_handlers)
                routes.push_back({method, translated, key, dispatcher.handler_for(key)});
        }

        std::sort(routes.begin(), routes.end(), [](const auto& lhs, const auto& rhs) {
            return std::tie(lhs.m_path, lhs.m_method) < std::tie(rhs.m_path, rhs.m_method);
        });

        return routes;
    }
}
