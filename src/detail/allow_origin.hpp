//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CORS_SRC_DETAIL_ALLOW_ORIGIN_HPP
#define BOOST_CORS_SRC_DETAIL_ALLOW_ORIGIN_HPP

#include <boost/cors/policy.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/core/detail/string_view.hpp>

namespace boost {
namespace cors {
namespace detail {

// Access-Control-Allow-Origin
// Access-Control-Allow-Credentials
inline
void
set_origin(
    http::fields& f,
    policy const& p,
    core::string_view origin)
{
    if(p.echoes_origin())
        f.set(http::field::access_control_allow_origin, origin);
    else
        f.set(http::field::access_control_allow_origin, "*");
    if(p.credentials())
        f.set(http::field::access_control_allow_credentials, "true");
}

} // detail
} // cors
} // boost

#endif
