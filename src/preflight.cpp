//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/cors/preflight.hpp>
#include <boost/cors/error.hpp>
#include <boost/cors/origin_matcher.hpp>
#include <boost/cors/token_set.hpp>
#include "src/detail/allow_origin.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace boost {
namespace cors {

namespace {

// Access-Control-Allow-Headers
void
set_allowed_headers(
    http::fields& f,
    classified_request const& cr,
    policy const& p)
{
    if(p.wildcard_header())
    {
        f.set(http::field::access_control_allow_headers, "*");
        return;
    }
    if(p.any_header())
    {
        if(cr.requested_headers.empty())
            return;
        std::string s;
        for(auto const& h : cr.requested_headers)
        {
            if(! s.empty())
                s += ", ";
            s += h;
        }
        f.set(http::field::access_control_allow_headers, s);
        return;
    }
    if(! p.allow_headers_value().empty())
        f.set(
            http::field::access_control_allow_headers,
            p.allow_headers_value());
}

// Vary
void
set_vary(
    http::fields& f,
    policy const& p)
{
    // echoed headers depend on the request too
    if(p.any_header() && ! p.wildcard_header())
        f.set(http::field::vary,
            "Origin, Access-Control-Request-Headers");
    else
        f.set(http::field::vary, "Origin");
}

cors_decision
reject(
    error e,
    classified_request const& cr,
    std::string const& detail)
{
    cors_decision d;
    d.reason = e;
    SPDLOG_INFO(
        "cors preflight rejected: {} {} (origin '{}')",
        d.reason.message(), detail, cr.origin);
    return d;
}

} // (anon)

cors_decision
evaluate_preflight(
    classified_request const& cr,
    policy const& p)
{
    if(! origin_matcher(p).matches(cr.origin))
        return reject(error::origin_not_allowed, cr, {});

    if(! p.methods().contains(cr.requested_method))
        return reject(error::method_not_allowed,
            cr, cr.requested_method);

    // in any-header mode the names are echoed,
    // so they must at least be tokens
    std::string denied;
    for(auto const& h : cr.requested_headers)
    {
        if(p.any_header() ?
            is_token(h) :
            p.headers().contains(h))
            continue;
        if(! denied.empty())
            denied += ", ";
        denied += h;
    }
    if(! denied.empty())
        return reject(error::header_not_allowed,
            cr, denied);

    cors_decision d;
    detail::set_origin(d.headers, p, cr.origin);
    d.headers.set(
        http::field::access_control_allow_methods,
        p.allow_methods_value());
    set_allowed_headers(d.headers, cr, p);
    if(p.max_age().count() > 0)
        d.headers.set(
            http::field::access_control_max_age,
            std::to_string(p.max_age().count()));
    set_vary(d.headers, p);
    return d;
}

http::response<http::string_body>
respond_preflight(
    classified_request const& cr,
    policy const& p)
{
    http::response<http::string_body> res;
    res.version(11);

    auto const d = evaluate_preflight(cr, p);
    if(d.authorized())
    {
        res.result(p.preflight_status());
        apply(d, res);
    }
    else
    {
        res.result(p.rejection_status());
        res.set(http::field::vary, "Origin");
    }
    // Safari and others need this for 204 or may hang
    res.content_length(0);
    return res;
}

} // cors
} // boost
