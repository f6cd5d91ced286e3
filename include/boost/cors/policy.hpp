//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CORS_POLICY_HPP
#define BOOST_CORS_POLICY_HPP

#include <boost/cors/detail/config.hpp>
#include <boost/cors/origin.hpp>
#include <boost/cors/token_set.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/core/detail/string_view.hpp>
#include <chrono>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace boost {
namespace cors {

/** How the any-origin rule fills Access-Control-Allow-Origin.
*/
enum class any_origin_mode
{
    /** `*` without credentials, the request origin with credentials. */
    automatic,

    /** Always `*`. Cannot be combined with credentials. */
    wildcard,

    /** Always the request origin. */
    reflect
};

/** The rule deciding which origins are allowed.

    A rule is one of:

    @li @ref any, which allows every origin,
    @li @ref exact, which allows a fixed set of origins
        compared with RFC 6454 semantics, or
    @li @ref matching, which asks a predicate.

    @par Example
    @code
    cors_options opts;
    opts.origins = allowed_origins::exact({
        "https://example.com",
        "https://app.example.com:8443" });
    @endcode
*/
class allowed_origins
{
public:
    /// The kind of rule
    enum class kind
    {
        any,
        exact,
        predicate
    };

    /// The predicate signature
    using predicate_type =
        std::function<bool(origin const&)>;

    /** Return a rule allowing any origin.

        @param mode How the allowed origin is emitted.

        @param allow_null Whether `Origin: null` is allowed.
    */
    BOOST_CORS_DECL
    static
    allowed_origins
    any(
        any_origin_mode mode = any_origin_mode::automatic,
        bool allow_null = true);

    /** Return a rule allowing a fixed set of origins.

        Each string is parsed with @ref origin::parse_allow_null.
        The null origin is allowed only when `"null"`
        is listed.

        @throws system::system_error if a string
        is not a valid origin.
    */
    BOOST_CORS_DECL
    static
    allowed_origins
    exact(std::initializer_list<
        core::string_view> origins);

    /// @copydoc exact
    BOOST_CORS_DECL
    static
    allowed_origins
    exact(std::vector<std::string> const& origins);

    /** Return a rule allowing a fixed set of origins.
    */
    BOOST_CORS_DECL
    static
    allowed_origins
    exact(std::vector<origin> origins);

    /** Return a rule which asks a predicate.

        The predicate is invoked with the parsed
        request origin, which may be the null origin.
        Origins which fail to parse are never allowed
        and never reach the predicate.
    */
    BOOST_CORS_DECL
    static
    allowed_origins
    matching(predicate_type pred);

    kind
    get_kind() const noexcept
    {
        return kind_;
    }

    any_origin_mode
    mode() const noexcept
    {
        return mode_;
    }

    bool
    allow_null() const noexcept
    {
        return allow_null_;
    }

    std::unordered_set<origin> const&
    origins() const noexcept
    {
        return set_;
    }

    predicate_type const&
    predicate() const noexcept
    {
        return pred_;
    }

private:
    allowed_origins() = default;

    kind kind_ = kind::any;
    any_origin_mode mode_ =
        any_origin_mode::automatic;
    bool allow_null_ = true;
    std::unordered_set<origin> set_;
    predicate_type pred_;
};

//------------------------------------------------

/** Options for CORS policy configuration.

    These options are consumed once, when a
    @ref policy is constructed.

    @see policy
*/
struct cors_options
{
    /// The origin rule.
    allowed_origins origins = allowed_origins::any();

    /// Allowed methods. Normalized to upper case.
    std::vector<std::string> methods;

    /// Allowed request headers. A `*` entry allows any header.
    std::vector<std::string> headers;

    /// If true, allow any request header and echo the requested list.
    bool allow_any_header = false;

    /// Response headers exposed to scripts, in order.
    std::vector<std::string> exposed_headers;

    /// Max age for preflight caching. Zero omits the header.
    std::chrono::seconds max_age{ 0 };

    /// Status of a successful preflight response.
    http::status preflight_status = http::status::ok;

    /// Status of a rejected preflight response.
    http::status rejection_status = http::status::forbidden;

    /// If true, allow credentials.
    bool credentials = false;
};

//------------------------------------------------

/** A validated, immutable CORS policy.

    A policy is built once from @ref cors_options
    and never changes afterwards, so a single
    instance may be shared by any number of
    concurrently handled requests without locking.

    The values of the preflight headers which do
    not depend on the request are computed at
    construction.

    @par Example
    @code
    cors_options opts;
    opts.origins = allowed_origins::exact({ "https://example.com" });
    opts.methods = { "GET", "POST" };
    opts.headers = { "Content-Type" };
    opts.credentials = true;
    auto p = make_policy( std::move(opts) );
    @endcode
*/
class policy
{
    allowed_origins origins_;
    token_set methods_;
    token_set headers_;
    token_set exposed_;
    std::string methods_value_;
    std::string headers_value_;
    std::string exposed_value_;
    std::chrono::seconds max_age_;
    http::status preflight_status_;
    http::status rejection_status_;
    bool any_header_ = false;
    bool wildcard_header_ = false;
    bool credentials_ = false;

public:
    /** Constructor

        @throws system::system_error with
        @li @ref error::credentials_with_wildcard if credentials
            are combined with the wildcard any-origin mode, a `*`
            allowed header or a `*` exposed header
        @li @ref error::invalid_method if a method is not a token
        @li @ref error::invalid_header_name if a header name is not a token
        @li @ref error::invalid_max_age if the max age is negative

        @param opts The options to validate.
    */
    BOOST_CORS_DECL
    explicit
    policy(cors_options opts);

    /** Return the permissive preset.

        The preset allows any origin, the methods
        `OPTIONS, GET, POST, PUT, DELETE, HEAD, TRACE,
        CONNECT, PATCH`, any request header, and a
        one hour max age. Credentials are disabled.
    */
    BOOST_CORS_DECL
    static
    cors_options
    permissive();

    allowed_origins const&
    origins() const noexcept
    {
        return origins_;
    }

    token_set const&
    methods() const noexcept
    {
        return methods_;
    }

    token_set const&
    headers() const noexcept
    {
        return headers_;
    }

    token_set const&
    exposed_headers() const noexcept
    {
        return exposed_;
    }

    /** Return true if any request header is allowed.
    */
    bool
    any_header() const noexcept
    {
        return any_header_ || wildcard_header_;
    }

    /** Return true if the allowed headers include `*`.
    */
    bool
    wildcard_header() const noexcept
    {
        return wildcard_header_;
    }

    bool
    credentials() const noexcept
    {
        return credentials_;
    }

    std::chrono::seconds
    max_age() const noexcept
    {
        return max_age_;
    }

    http::status
    preflight_status() const noexcept
    {
        return preflight_status_;
    }

    http::status
    rejection_status() const noexcept
    {
        return rejection_status_;
    }

    /// Return the Access-Control-Allow-Methods value.
    core::string_view
    allow_methods_value() const noexcept
    {
        return methods_value_;
    }

    /// Return the configured Access-Control-Allow-Headers value.
    core::string_view
    allow_headers_value() const noexcept
    {
        return headers_value_;
    }

    /// Return the Access-Control-Expose-Headers value.
    core::string_view
    expose_headers_value() const noexcept
    {
        return exposed_value_;
    }

    /** Return true if an authorized origin is echoed.

        When this returns `false` the literal `*`
        is emitted instead.
    */
    BOOST_CORS_DECL
    bool
    echoes_origin() const noexcept;
};

/** Return a shared policy built from options.

    @throws system::system_error on invalid options.
*/
BOOST_CORS_DECL
std::shared_ptr<policy const>
make_policy(cors_options opts);

} // cors
} // boost

#endif
