/**
 * @file internal.hxx
 * @brief Internal implementation details for route handling.
 */

#ifndef ROUTEKIT_ROUTE_INTERNAL_HXX
#define ROUTEKIT_ROUTE_INTERNAL_HXX

namespace routekit::route::internal {
    /**
     * @brief Segment trie mapping raw request paths to values registered by template segments.
     * @tparam _type_t Type of the value stored at a terminal node.
     *
     * Literal segments are tried before parameter segments; a dead end on the
     * literal branch falls back to the parameter branch.
     */
    template <typename _type_t>
    struct trie_node_t {
        ROUTEKIT_INLINE trie_node_t() { m_child.reserve(16u); }

      public:
        /**
         * @brief Register a value for a segment sequence.
         * @param segments Template segments; every parameter segment matches any one path segment.
         * @param value Value to store.
         * @return false when a value was already stored for the same shape and got replaced.
         */
        bool insert(const path::segments_t& segments, _type_t value);

        /**
         * @brief Match a raw request path.
         * @param path Request path, already normalized by the caller.
         * @return The stored value and the raw text of every parameter segment, in path order.
         */
        std::optional<std::pair<_type_t, std::vector<std::string>>> find(const std::string_view& path) const;

        /**
         * @brief Split a path on '/', dropping the leading separator.
         * @param path The path to split.
         * @return Segments, possibly containing empty entries for doubled or trailing slashes.
         */
        static std::vector<std::string_view> split_path(const std::string_view& path);

      private:
        bool find_from(
            const std::vector<std::string_view>& parts,
            std::size_t index,

            std::vector<std::string>& captured,

            const trie_node_t*& hit
        ) const;

      private:
        /** @brief Value stored when a path ends at this node. */
        std::optional<_type_t> m_value{};

        /** @brief Child nodes for literal segments. */
        boost::unordered_map<std::string, std::shared_ptr<trie_node_t>> m_child{};

        /** @brief Child node for a parameter segment. */
        std::shared_ptr<trie_node_t> m_dynamic_child{};
    };

    /**
     * @brief Detects sync handlers: callables returning a response for a context.
     */
    template <typename _fn_t>
    concept sync_handler_c = requires(const _fn_t& fn, http::http_ctx_t& ctx) {
        { fn(ctx) } -> std::same_as<http::response_t>;
    };

    /**
     * @brief Detects async handlers: callables returning an awaitable response for a context.
     */
    template <typename _fn_t>
    concept async_handler_c = requires(const _fn_t& fn, http::http_ctx_t& ctx) {
        { fn(ctx) } -> std::same_as<boost::asio::awaitable<http::response_t>>;
    };
}

#endif // ROUTEKIT_ROUTE_INTERNAL_HXX
