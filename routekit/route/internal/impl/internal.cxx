#include <routekit.hxx>

namespace routekit::route::internal {
    template <typename _type_t>
    bool trie_node_t<_type_t>::insert(const path::segments_t& segments, _type_t value) {
        auto node = this;

        for (const auto& segment : segments) {
            if (segment.m_is_param) {
                if (!node->m_dynamic_child)
                    node->m_dynamic_child = std::make_shared<trie_node_t>();

                node = node->m_dynamic_child.get();

                continue;
            }

            auto& child = node->m_child[segment.m_text];

            if (!child)
                child = std::make_shared<trie_node_t>();

            node = child.get();
        }

        const auto replaced = node->m_value.has_value();

        node->m_value = std::move(value);

        return !replaced;
    }

    template <typename _type_t>
    std::optional<std::pair<_type_t, std::vector<std::string>>> trie_node_t<_type_t>::find(const std::string_view& path) const {
        const auto parts = split_path(path);

        std::vector<std::string> captured{};

        captured.reserve(parts.size());

        const trie_node_t* hit{};

        if (!find_from(parts, 0u, captured, hit))
            return std::nullopt;

        return std::make_pair(hit->m_value.value(), std::move(captured));
    }

    template <typename _type_t>
    bool trie_node_t<_type_t>::find_from(
        const std::vector<std::string_view>& parts,
        std::size_t index,

        std::vector<std::string>& captured,

        const trie_node_t*& hit
    ) const {
        if (index == parts.size()) {
            if (!m_value.has_value())
                return false;

            hit = this;

            return true;
        }

        const auto part = parts[index];

        if (part.empty())
            return false;

        if (const auto it = m_child.find(std::string{part}); it != m_child.end()) {
            if (it->second->find_from(parts, index + 1u, captured, hit))
                return true;
        }

        if (!m_dynamic_child)
            return false;

        captured.emplace_back(part);

        if (m_dynamic_child->find_from(parts, index + 1u, captured, hit))
            return true;

        captured.pop_back();

        return false;
    }

    template <typename _type_t>
    std::vector<std::string_view> trie_node_t<_type_t>::split_path(const std::string_view& path) {
        std::vector<std::string_view> segments{};

        if (path.empty() || path == "/")
            return segments;

        auto start = path.front() == '/' ? 1u : 0u;
        auto end = path.find('/', start);

        while (end != std::string_view::npos) {
            segments.emplace_back(path.substr(start, end - start));

            start = end + 1u;
            end = path.find('/', start);
        }

        segments.emplace_back(path.substr(start));

        return segments;
    }

    /**
     * @brief Explicit template instantiation for trie_node_t keyed to route table keys.
     */
    template struct trie_node_t<std::string>;
}
