//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/cors/error.hpp>

namespace boost {
namespace cors {
namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "boost.cors";
}

std::string
error_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
error_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::ok: return "success";
    case error::invalid_origin: return "invalid origin";
    case error::missing_host: return "origin has no host";
    case error::unsupported_scheme: return "unsupported origin scheme";
    case error::invalid_port: return "invalid origin port";
    case error::credentials_with_wildcard: return "credentials cannot be combined with a wildcard";
    case error::invalid_method: return "invalid method token";
    case error::invalid_header_name: return "invalid header name";
    case error::invalid_max_age: return "invalid max-age";
    case error::origin_not_allowed: return "origin not allowed";
    case error::method_not_allowed: return "method not allowed";
    case error::header_not_allowed: return "header not allowed";
    default:
        return "unknown";
    }
}

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
#else
error_cat_type error_cat;
#endif

} // detail
} // cors
} // boost
