/**
 * @file http.hxx
 * @brief Core HTTP types, status codes and methods for routekit.
 */

#ifndef ROUTEKIT_HTTP_HXX
#define ROUTEKIT_HTTP_HXX

#include "utils/utils.hxx"

namespace routekit::http {
    /** @brief Type alias for a request path. */
    using path_t = std::string;

    /** @brief Type alias for an HTTP message body. */
    using body_t = std::string;

    /** @brief Type alias for HTTP headers (case-insensitive keys). */
    using headers_t = std::map<std::string, std::string, internal::ci_less_t>;

    /** @brief Raw path parameter values as captured by the transport, by name. */
    using params_t = std::map<std::string, std::string>;

    /** @brief Raw query values as captured by the transport; a name may repeat. */
    using query_t = std::map<std::string, std::vector<std::string>>;

    /** @brief A coerced parameter value. */
    using value_t = std::variant<std::string, std::int64_t, bool>;

    /** @brief Coerced path parameters, by name. */
    using values_t = std::map<std::string, value_t>;

    /** @brief Coerced query parameters, by name; arrays hold every element, scalars one. */
    using query_values_t = std::map<std::string, std::vector<value_t>>;

    /**
     * @brief HTTP status codes produced by the library itself or commonly returned by handlers.
     */
    enum struct e_status : std::int16_t {
        ok = 200,                    ///< The request was successful.
        created = 201,               ///< The resource was successfully created.
        accepted = 202,              ///< The request has been accepted for processing.
        no_content = 204,            ///< Success without a body.
        moved_permanently = 301,     ///< The resource has moved permanently.
        found = 302,                 ///< The resource has moved temporarily.
        not_modified = 304,          ///< The resource has not been modified.
        bad_request = 400,           ///< The request was malformed or invalid.
        unauthorized = 401,          ///< Authentication is required.
        forbidden = 403,             ///< The client lacks permission.
        not_found = 404,             ///< No route matches the path.
        method_not_allowed = 405,    ///< The route exists but not for this method.
        conflict = 409,              ///< The request conflicts with the resource state.
        unprocessable_entity = 422,  ///< The request is well formed but semantically invalid.
        too_many_requests = 429,     ///< Rate limited.
        internal_server_error = 500, ///< The server encountered an internal error.
        not_implemented = 501,       ///< The server does not support the functionality.
        service_unavailable = 503    ///< The server is temporarily unavailable.
    };

    /**
     * @brief HTTP methods a route can be registered for.
     *
     * `all` is a registration slot meaning "every method"; it never appears on a request.
     */
    enum struct e_method : std::int16_t {
        get,     ///< GET
        head,    ///< HEAD
        post,    ///< POST
        put,     ///< PUT
        delete_, ///< DELETE
        options, ///< OPTIONS
        patch,   ///< PATCH
        all,     ///< Catch-all registration slot
        unknown  ///< Unknown or unsupported method
    };

    /**
     * @brief Convert HTTP method enum to string.
     * @param method HTTP method enum value.
     * @return Upper-case method name, "ALL" for the catch-all slot.
     */
    ROUTEKIT_INLINE constexpr std::string_view method_to_str(const e_method& method) {
        switch (method) {
            case e_method::get:
                return "GET";
            case e_method::head:
                return "HEAD";
            case e_method::post:
                return "POST";
            case e_method::put:
                return "PUT";
            case e_method::delete_:
                return "DELETE";
            case e_method::options:
                return "OPTIONS";
            case e_method::patch:
                return "PATCH";
            case e_method::all:
                return "ALL";
            default:
                return "UNKNOWN";
        }
    }

    /**
     * @brief Convert an HTTP method name to the enum value.
     * @param method_str Upper-case method name.
     * @return Matching value, `unknown` for anything outside the closed set.
     */
    ROUTEKIT_INLINE constexpr e_method str_to_method(const std::string_view& method_str) {
        switch (utils::fnv1a_hash(method_str)) {
            case utils::fnv1a_hash("GET"):
                return e_method::get;

            case utils::fnv1a_hash("HEAD"):
                return e_method::head;

            case utils::fnv1a_hash("POST"):
                return e_method::post;

            case utils::fnv1a_hash("PUT"):
                return e_method::put;

            case utils::fnv1a_hash("DELETE"):
                return e_method::delete_;

            case utils::fnv1a_hash("OPTIONS"):
                return e_method::options;

            case utils::fnv1a_hash("PATCH"):
                return e_method::patch;

            default:
                return e_method::unknown;
        }
    }
}

#include "request/request.hxx"

#include "response/response.hxx"

#include "http_ctx/http_ctx.hxx"

#endif // ROUTEKIT_HTTP_HXX
