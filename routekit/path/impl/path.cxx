#include <routekit.hxx>

namespace routekit::path {
    namespace {
        using exceptions::path_template_syntax_exception_t;

        ROUTEKIT_INLINE bool is_name_char(const char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        }

        /**
         * @brief Forward-only cursor over a template.
         *
         * Every read is bounded by the template length; an unterminated group is
         * reported as soon as the cursor reaches the end.
         */
        class c_scanner {
          public:
            ROUTEKIT_INLINE explicit c_scanner(const std::string_view& source) : m_source(source) {}

          public:
            /**
             * @brief Scan the whole template.
             */
            parsed_path_t run() {
                parsed_path_t result{};

                result.m_template = std::string{m_source};

                auto query_at = std::string_view::npos;

                std::string literal{};

                auto flush = [&] {
                    if (!literal.empty())
                        result.m_segments.push_back({std::move(literal), false});

                    literal.clear();
                };

                while (!done()) {
                    const auto c = peek();

                    if (c == '<') {
                        if (!literal.empty())
                            fail("Path parameter must span a whole segment", m_pos - literal.size());

                        const auto open = m_pos;

                        auto descriptor = read_path_param();

                        if (!done() && peek() != '/' && peek() != '?')
                            fail("Path parameter must span a whole segment", open);

                        if (result.m_path_params.contains(descriptor.m_name))
                            fail_at("Duplicate path parameter", descriptor.m_name, open);

                        result.m_segments.push_back({descriptor.m_name, true});

                        result.m_path_params.emplace(descriptor.m_name, std::move(descriptor));
                    }
                    else if (c == '\\' && m_pos + 1u < m_source.size() && m_source[m_pos + 1u] == '?') {
                        literal += '?';

                        advance(2u);
                    }
                    else if (c == '?') {
                        query_at = m_pos;

                        advance();

                        read_query(result.m_query_params);
                    }
                    else if (c == '/') {
                        flush();

                        advance();
                    }
                    else {
                        literal += c;

                        advance();
                    }
                }

                flush();

                result.m_url_path = std::string{m_source.substr(0u, query_at)};

                if (query_at != std::string_view::npos)
                    result.m_query_path = std::string{m_source.substr(query_at + 1u)};

                return result;
            }

          private:
            ROUTEKIT_INLINE bool done() const { return m_pos >= m_source.size(); }

            ROUTEKIT_INLINE char peek() const { return m_source[m_pos]; }

            ROUTEKIT_INLINE void advance(const std::size_t count = 1u) { m_pos = std::min(m_pos + count, m_source.size()); }

            ROUTEKIT_INLINE void skip_spaces() {
                while (!done() && (peek() == ' ' || peek() == '\t'))
                    advance();
            }

            /**
             * @brief Throw with the text between @p from and the cursor as fragment.
             */
            [[noreturn]] void fail(const std::string& what, const std::size_t from) const {
                const auto length = std::max<std::size_t>(m_pos > from ? m_pos - from : 1u, 1u);

                fail_at(what, std::string{m_source.substr(from, length)}, from);
            }

            [[noreturn]] void fail_at(const std::string& what, std::string fragment, const std::size_t position) const {
                throw path_template_syntax_exception_t(what, std::move(fragment), position);
            }

            std::regex compile(const std::string& pattern, const std::size_t at) const {
                try {
                    return std::regex{pattern, std::regex::ECMAScript};
                }
                catch (const std::regex_error& e) {
                    fail_at(fmt::format("Invalid regular expression ({})", e.what()), pattern, at);
                }
            }

            /**
             * @brief Read a `{...}` group starting at the cursor; nested braces must balance.
             * @return The text between the outermost braces.
             */
            std::string read_braced() {
                const auto open = m_pos;

                std::size_t depth{};

                std::string pattern{};

                while (!done()) {
                    const auto c = peek();

                    if (c == '\\' && m_pos + 1u < m_source.size()) {
                        pattern += c;
                        pattern += m_source[m_pos + 1u];

                        advance(2u);

                        continue;
                    }

                    advance();

                    if (c == '{' && depth++ == 0u)
                        continue;

                    if (c == '}' && --depth == 0u)
                        return pattern;

                    pattern += c;
                }

                fail("Unclosed '{'", open);
            }

            /**
             * @brief Read `<name>`, `<name: type>` or `<name: {pattern}>` starting at the cursor.
             */
            param_descriptor_t read_path_param() {
                const auto open = m_pos;

                advance();

                skip_spaces();

                param_descriptor_t descriptor{};

                while (!done() && is_name_char(peek())) {
                    descriptor.m_name += peek();

                    advance();
                }

                skip_spaces();

                if (done())
                    fail("Unclosed '<'", open);

                if (descriptor.m_name.empty())
                    fail("Path parameter without a name", open);

                if (peek() == ':') {
                    advance();

                    skip_spaces();

                    if (done())
                        fail("Unclosed '<'", open);

                    if (peek() == '{') {
                        const auto regex_at = m_pos;

                        descriptor.m_pattern = read_braced();
                        descriptor.m_regex = compile(descriptor.m_pattern, regex_at);

                        descriptor.add_type(e_param_type::regex);
                    }
                    else {
                        const auto type_at = m_pos;

                        std::string type_name{};

                        while (!done() && is_name_char(peek())) {
                            type_name += peek();

                            advance();
                        }

                        skip_spaces();

                        if (done())
                            fail("Unclosed '<'", open);

                        const auto type = str_to_type(type_name);

                        if (!type.has_value())
                            fail_at("Unknown parameter type", type_name.empty() ? std::string(1u, peek()) : type_name, type_at);

                        descriptor.add_type(type.value());
                    }

                    skip_spaces();

                    if (done())
                        fail("Unclosed '<'", open);
                }
                else
                    descriptor.add_type(e_param_type::string);

                if (peek() != '>')
                    fail("Unexpected character in path parameter", m_pos);

                advance();

                return descriptor;
            }

            /**
             * @brief Read a `(a|b|...)` list into @p descriptor; type names become types, anything else an allowed value.
             */
            void read_group(param_descriptor_t& descriptor) {
                const auto open = m_pos;

                advance();

                std::string entry{};

                auto flush = [&] {
                    boost::trim(entry);

                    if (entry.empty())
                        fail("Empty entry in parameter list", open);

                    if (const auto type = str_to_type(entry); type.has_value())
                        descriptor.add_type(type.value());
                    else
                        descriptor.m_enum_values.push_back(entry);

                    entry.clear();
                };

                while (!done() && peek() != '&') {
                    const auto c = peek();

                    advance();

                    if (c == ')') {
                        flush();

                        return;
                    }

                    if (c == '|')
                        flush();
                    else
                        entry += c;
                }

                fail("Unclosed '('", open);
            }

            /**
             * @brief Read `name=type` pairs until the end of the template.
             */
            void read_query(params_t& params) {
                while (!done()) {
                    skip_spaces();

                    if (done())
                        break;

                    if (peek() == '&') {
                        advance();

                        continue;
                    }

                    const auto name_at = m_pos;

                    param_descriptor_t descriptor{};

                    while (!done() && peek() != '=' && peek() != '&') {
                        if (peek() != ' ')
                            descriptor.m_name += peek();

                        advance();
                    }

                    if (descriptor.m_name.empty())
                        fail("Query parameter without a name", name_at);

                    if (done() || peek() != '=')
                        fail_at("Missing '=' after query parameter", descriptor.m_name, name_at);

                    advance();

                    skip_spaces();

                    if (!done() && peek() == '{') {
                        const auto regex_at = m_pos;

                        descriptor.m_pattern = read_braced();
                        descriptor.m_regex = compile(descriptor.m_pattern, regex_at);

                        skip_spaces();
                    }

                    if (!done() && peek() == ':')
                        advance();

                    read_query_type(descriptor);

                    if (descriptor.m_types.empty())
                        descriptor.add_type(descriptor.m_regex.has_value() ? e_param_type::regex : e_param_type::string);

                    if (params.contains(descriptor.m_name))
                        fail_at("Duplicate query parameter", descriptor.m_name, name_at);

                    params.emplace(descriptor.m_name, std::move(descriptor));
                }
            }

            /**
             * @brief Read the type part of a query pair: bare type, `(...)` list, `[]` and `?` modifiers.
             */
            void read_query_type(param_descriptor_t& descriptor) {
                std::string type_name{};

                auto type_at = m_pos;

                auto flush = [&] {
                    if (type_name.empty())
                        return;

                    const auto type = str_to_type(type_name);

                    if (!type.has_value())
                        fail_at("Unknown parameter type", type_name, type_at);

                    descriptor.add_type(type.value());

                    type_name.clear();
                };

                while (!done() && peek() != '&') {
                    const auto c = peek();

                    if (c == ' ') {
                        advance();

                        continue;
                    }

                    if (c == '?') {
                        flush();

                        descriptor.m_is_optional = true;

                        advance();
                    }
                    else if (c == '[') {
                        flush();

                        if (m_pos + 1u >= m_source.size() || m_source[m_pos + 1u] != ']')
                            fail("Unclosed '['", m_pos);

                        descriptor.m_is_array = true;

                        advance(2u);
                    }
                    else if (c == '(') {
                        flush();

                        read_group(descriptor);
                    }
                    else {
                        if (type_name.empty())
                            type_at = m_pos;

                        type_name += c;

                        advance();
                    }
                }

                flush();
            }

          private:
            /** @brief Template being scanned. */
            std::string_view m_source{};

            /** @brief Cursor, never past m_source.size(). */
            std::size_t m_pos{};
        };
    }

    parsed_path_t parse(const std::string_view& path_template) {
        return c_scanner{path_template}.run();
    }

    params_t merge_params(const params_t& ancestor, const params_t& descendant) {
        auto merged = ancestor;

        for (const auto& [name, descriptor] : descendant)
            merged.insert_or_assign(name, descriptor);

        return merged;
    }
}
