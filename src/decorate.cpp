//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/cors/decorate.hpp>
#include <boost/cors/error.hpp>
#include <boost/cors/origin_matcher.hpp>
#include "src/detail/allow_origin.hpp"
#include <spdlog/spdlog.h>

namespace boost {
namespace cors {

cors_decision
evaluate_actual(
    classified_request const& cr,
    policy const& p)
{
    cors_decision d;
    if(! origin_matcher(p).matches(cr.origin))
    {
        d.reason = error::origin_not_allowed;
        return d;
    }
    detail::set_origin(d.headers, p, cr.origin);
    if(! p.expose_headers_value().empty())
        d.headers.set(
            http::field::access_control_expose_headers,
            p.expose_headers_value());
    d.headers.set(http::field::vary, "Origin");
    return d;
}

bool
decorate(
    classified_request const& cr,
    http::fields& res,
    policy const& p)
{
    auto const d = evaluate_actual(cr, p);
    if(! d.authorized())
    {
        SPDLOG_DEBUG(
            "cors origin '{}' not allowed, response left unmodified",
            cr.origin);
        return false;
    }
    apply(d, res);
    return true;
}

} // cors
} // boost
