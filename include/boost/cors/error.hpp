//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CORS_ERROR_HPP
#define BOOST_CORS_ERROR_HPP

#include <boost/cors/detail/config.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/is_error_code_enum.hpp>
#include <system_error>

namespace boost {
namespace cors {

/** Error codes returned by the CORS engine.

    The codes fall into three groups. Origin parsing
    errors come from @ref origin::parse. Configuration
    errors are thrown when a @ref policy is constructed
    from inconsistent options. Rejection codes explain
    why a preflight was refused; they are reported in
    a @ref cors_decision and are never thrown.
*/
enum class error
{
    /// Success
    ok = 0,

    //
    // origin parsing
    //

    /// The string is not an absolute URI
    invalid_origin,

    /// The URI has no host component
    missing_host,

    /// The scheme has no known default port and none was given
    unsupported_scheme,

    /// The port is out of range
    invalid_port,

    //
    // configuration
    //

    /// Credentials were combined with a literal `*` value
    credentials_with_wildcard,

    /// A configured method is not a valid token
    invalid_method,

    /// A configured header name is not a valid token
    invalid_header_name,

    /// The configured max-age is negative
    invalid_max_age,

    //
    // preflight rejection
    //

    /// The request origin is not allowed
    origin_not_allowed,

    /// The requested method is not allowed
    method_not_allowed,

    /// At least one requested header is not allowed
    header_not_allowed
};

} // cors

namespace system {
template<>
struct is_error_code_enum<
    ::boost::cors::error>
{
    static bool const value = true;
};
} // system
} // boost

namespace std {
template<>
struct is_error_code_enum<
    ::boost::cors::error>
    : std::true_type {};
} // std

namespace boost {
namespace cors {

namespace detail {

struct BOOST_SYMBOL_VISIBLE
    error_cat_type
    : system::error_category
{
    BOOST_CORS_DECL const char* name(
        ) const noexcept override;
    BOOST_CORS_DECL std::string message(
        int) const override;
    BOOST_CORS_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0x3c1a6f0d9e52b487)
    {
    }
};

BOOST_CORS_DECL extern
    error_cat_type error_cat;

} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(
    error ev) noexcept
{
    return system::error_code{
        static_cast<std::underlying_type<
            error>::type>(ev),
        detail::error_cat};
}

} // cors
} // boost

#endif
