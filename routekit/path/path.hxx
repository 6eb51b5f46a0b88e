/**
 * @file path.hxx
 * @brief Path template language: typed path and query parameter descriptors.
 *
 * A template mixes literal segments with parameter placeholders and may end
 * with a query section:
 *
 * @code
 * /users/<id: number>/posts/<slug>?page=number&tags=string[]&sort=string(asc|desc)?
 * /codes/<code: {^[A-Z]{3}$}>
 * @endcode
 *
 * Templates are parsed once, when a route is declared.
 */

#ifndef ROUTEKIT_PATH_HXX
#define ROUTEKIT_PATH_HXX

namespace routekit::path {
    /**
     * @brief Value types a parameter can be declared with.
     */
    enum struct e_param_type : std::uint8_t {
        string,  ///< Passed through unchanged.
        number,  ///< Parsed as a signed 64-bit integer.
        boolean, ///< "true" or "false".
        regex    ///< Passed through when the declared pattern matches.
    };

    /**
     * @brief Convert a parameter type to its template spelling.
     */
    ROUTEKIT_INLINE constexpr std::string_view type_to_str(const e_param_type& type) {
        switch (type) {
            case e_param_type::string:
                return "string";
            case e_param_type::number:
                return "number";
            case e_param_type::boolean:
                return "boolean";
            case e_param_type::regex:
                return "regex";
        }

        return "unknown";
    }

    /**
     * @brief Parse a type name as written in a template.
     * @return The type, or nullopt for anything but string, number and boolean.
     */
    ROUTEKIT_INLINE std::optional<e_param_type> str_to_type(const std::string_view& str) {
        if (str == "string")
            return e_param_type::string;

        if (str == "number")
            return e_param_type::number;

        if (str == "boolean")
            return e_param_type::boolean;

        return std::nullopt;
    }

    /**
     * @brief Everything known about one declared path or query parameter.
     */
    struct param_descriptor_t {
        /**
         * @brief Whether @p type is among the declared types.
         */
        [[nodiscard]] ROUTEKIT_INLINE bool has_type(const e_param_type& type) const {
            return std::find(m_types.begin(), m_types.end(), type) != m_types.end();
        }

        /**
         * @brief Add a type, keeping declaration order and skipping duplicates.
         */
        ROUTEKIT_INLINE void add_type(const e_param_type& type) {
            if (!has_type(type))
                m_types.push_back(type);
        }

        /** @brief Parameter name. */
        std::string m_name{};

        /** @brief Accepted types, tried in declaration order. */
        std::vector<e_param_type> m_types{};

        /** @brief Allowed literal values from a parenthesized list; empty means unrestricted. */
        std::vector<std::string> m_enum_values{};

        /** @brief Query only: the parameter collects every value. */
        bool m_is_array{};

        /** @brief Query only: absence is not reported as missing. */
        bool m_is_optional{};

        /** @brief Source text of the regex override, empty when none. */
        std::string m_pattern{};

        /** @brief Compiled regex override. */
        std::optional<std::regex> m_regex{};
    };

    /** @brief Descriptors by parameter name. */
    using params_t = std::map<std::string, param_descriptor_t>;

    /**
     * @brief One piece of the URL part of a template.
     */
    struct segment_t {
        /** @brief Literal text, or the parameter name when m_is_param is set. */
        std::string m_text{};

        /** @brief Whether this segment is a path parameter reference. */
        bool m_is_param{};

        ROUTEKIT_INLINE bool operator==(const segment_t& other) const = default;
    };

    /** @brief Ordered segments of a path. */
    using segments_t = std::vector<segment_t>;

    /**
     * @brief Result of parsing one template. Immutable once built.
     */
    struct parsed_path_t {
        /** @brief The template as declared. */
        std::string m_template{};

        /** @brief Template without its query section. */
        std::string m_url_path{};

        /** @brief Query section without the leading '?'. */
        std::string m_query_path{};

        /** @brief Path parameter descriptors. */
        params_t m_path_params{};

        /** @brief Query parameter descriptors. */
        params_t m_query_params{};

        /** @brief Literal and parameter segments of the URL part, in order. */
        segments_t m_segments{};
    };

    /**
     * @brief Parse a path template.
     * @param path_template Template as declared on a route.
     * @return The parsed template.
     * @throws exceptions::path_template_syntax_exception_t on malformed input.
     */
    parsed_path_t parse(const std::string_view& path_template);

    /**
     * @brief Merge two descriptor maps; entries of @p descendant replace same-named entries of @p ancestor.
     */
    params_t merge_params(const params_t& ancestor, const params_t& descendant);
}

#endif // ROUTEKIT_PATH_HXX
