#include <routekit.hxx>

namespace routekit::route {
    namespace {
        using exceptions::route_exception_t;

        std::string join_query(const std::string& ancestor, const std::string& descendant) {
            if (ancestor.empty())
                return descendant;

            if (descendant.empty())
                return ancestor;

            return fmt::format("{}&{}", ancestor, descendant);
        }

        template <typename _type_t>
        std::vector<_type_t> concat(const std::vector<_type_t>& head, const std::vector<_type_t>& tail) {
            std::vector<_type_t> result{};

            result.reserve(head.size() + tail.size());
            result.insert(result.end(), head.begin(), head.end());
            result.insert(result.end(), tail.begin(), tail.end());

            return result;
        }

        bool same_params(const path::params_t& lhs, const path::params_t& rhs) {
            return std::equal(
                lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                [](const auto& a, const auto& b) {
                    return a.first == b.first
                           && a.second.m_types == b.second.m_types
                           && a.second.m_enum_values == b.second.m_enum_values
                           && a.second.m_is_array == b.second.m_is_array
                           && a.second.m_is_optional == b.second.m_is_optional
                           && a.second.m_pattern == b.second.m_pattern;
                }
            );
        }
    }

    bool route_entry_t::operator==(const route_entry_t& other) const {
        return m_full_url_path == other.m_full_url_path
               && m_full_query_path == other.m_full_query_path
               && m_middlewares == other.m_middlewares
               && same_params(m_path_params, other.m_path_params)
               && same_params(m_query_params, other.m_query_params)
               && m_segments == other.m_segments
               && m_handlers == other.m_handlers
               && m_origin == other.m_origin;
    }

    std::shared_ptr<c_router> path(const std::string_view& path_template) {
        return std::make_shared<c_router>(path_template);
    }

    std::shared_ptr<c_router> nested(const std::string_view& path_template) {
        return path(path_template);
    }

    c_router::c_router(const std::string_view& path_template)
        : m_parsed(path::parse(path_template)) {}

    c_router& c_router::nested(const std::vector<ptr_t>& children) {
        for (const auto& child : children) {
            if (!child)
                throw route_exception_t(fmt::format("Null router nested into '{}'", declared_path()));

            if (child.get() == this)
                throw route_exception_t(fmt::format("Router '{}' cannot be nested into itself", declared_path()));

            for (auto ancestor = m_parent; ancestor; ancestor = ancestor->m_parent) {
                if (ancestor == child.get())
                    throw route_exception_t(
                        fmt::format("Nesting '{}' into '{}' would create a cycle", child->declared_path(), declared_path())
                    );
            }

            if (child->m_parent)
                throw route_exception_t(
                    fmt::format("Router '{}' is already nested into '{}'", child->declared_path(), child->m_parent->declared_path())
                );

            child->m_parent = this;

            m_children.push_back(child);

#ifdef ROUTEKIT_USE_LOGGING_IMPL
            g_logging->log(e_log_level::debug, "[Router] Nested '{}' into '{}'", child->declared_path(), declared_path());
#endif // ROUTEKIT_USE_LOGGING_IMPL

            child->propagate();
        }

        return *this;
    }

    c_router& c_router::middlewares(middleware::middlewares_t middlewares) {
        m_middlewares.insert(
            m_middlewares.end(),
            std::make_move_iterator(middlewares.begin()),
            std::make_move_iterator(middlewares.end())
        );

        rebuild();
        propagate();

        return *this;
    }

    c_router& c_router::handle(const http::e_method& method, handler_t handler) {
        if (!handler)
            throw route_exception_t(fmt::format("Null handler for {} '{}'", http::method_to_str(method), declared_path()));

        if (method == http::e_method::unknown)
            throw route_exception_t(fmt::format("Unknown method for '{}'", declared_path()));

        if (method == http::e_method::all)
            m_handlers.clear();
        else
            m_handlers.erase(http::e_method::all);

        m_handlers.insert_or_assign(method, std::move(handler));

        propagate();

        return *this;
    }

    void c_router::compose() {
        rebuild_subtree();
        propagate();
    }

    route_entry_t c_router::own_entry() const {
        route_entry_t entry{};

        entry.m_full_url_path = m_parsed.m_url_path;
        entry.m_full_query_path = m_parsed.m_query_path;
        entry.m_middlewares = m_middlewares;
        entry.m_path_params = m_parsed.m_path_params;
        entry.m_query_params = m_parsed.m_query_params;
        entry.m_segments = m_parsed.m_segments;
        entry.m_handlers = m_handlers;
        entry.m_origin = this;

        return entry;
    }

    void c_router::propagate() {
        const c_router* descendant = this;

        for (auto ancestor = m_parent; ancestor; ancestor = ancestor->m_parent) {
            ancestor->absorb(*descendant);

            descendant = ancestor;
        }
    }

    void c_router::rebuild() {
        for (const auto& child : m_children)
            absorb(*child);
    }

    void c_router::rebuild_subtree() {
        for (const auto& child : m_children)
            child->rebuild_subtree();

        rebuild();
    }

    void c_router::absorb(const c_router& descendant) {
        const auto& own = m_parsed;

        if (descendant.has_handlers()) {
            const auto& child = descendant.m_parsed;

            route_entry_t entry{};

            entry.m_full_url_path = own.m_url_path + child.m_url_path;
            entry.m_full_query_path = join_query(own.m_query_path, child.m_query_path);
            entry.m_middlewares = concat(m_middlewares, descendant.m_middlewares);
            entry.m_path_params = path::merge_params(own.m_path_params, child.m_path_params);
            entry.m_query_params = path::merge_params(own.m_query_params, child.m_query_params);
            entry.m_segments = concat(own.m_segments, child.m_segments);
            entry.m_handlers = descendant.m_handlers;
            entry.m_origin = &descendant;

            store(child.m_url_path, std::move(entry));
        }

        for (const auto& [child_path, child_entry] : descendant.m_routes) {
            route_entry_t entry{};

            entry.m_full_url_path = own.m_url_path + child_entry.m_full_url_path;
            entry.m_full_query_path = join_query(own.m_query_path, child_entry.m_full_query_path);
            entry.m_middlewares = concat(m_middlewares, child_entry.m_middlewares);
            entry.m_path_params = path::merge_params(own.m_path_params, child_entry.m_path_params);
            entry.m_query_params = path::merge_params(own.m_query_params, child_entry.m_query_params);
            entry.m_segments = concat(own.m_segments, child_entry.m_segments);
            entry.m_handlers = child_entry.m_handlers;
            entry.m_origin = child_entry.m_origin;

            store(descendant.m_parsed.m_url_path + child_path, std::move(entry));
        }
    }

    void c_router::store(const std::string& key, route_entry_t&& entry) {
        if (const auto it = m_routes.find(key); it != m_routes.end() && it->second.m_origin != entry.m_origin) {
#ifdef ROUTEKIT_USE_LOGGING_IMPL
            g_logging->log(
                e_log_level::warning,
                "[Router] Route '{}' under '{}' is declared by more than one router, the latest declaration wins",
                key,
                declared_path()
            );
#endif // ROUTEKIT_USE_LOGGING_IMPL
        }

        m_routes.insert_or_assign(key, std::move(entry));
    }
}
