//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CORS_DECORATE_HPP
#define BOOST_CORS_DECORATE_HPP

#include <boost/cors/detail/config.hpp>
#include <boost/cors/classify.hpp>
#include <boost/cors/decision.hpp>
#include <boost/cors/policy.hpp>
#include <boost/beast/http/fields.hpp>

namespace boost {
namespace cors {

/** Check an actual cross-origin request against a policy.

    Only the origin is checked. When it is allowed,
    the headers are `Access-Control-Allow-Origin`,
    `Access-Control-Allow-Credentials` when credentials
    are enabled, `Access-Control-Expose-Headers` when
    any are configured, and `Vary: Origin`.

    @param cr A request classified as @ref request_kind::actual.

    @param p The policy.
*/
BOOST_CORS_DECL
cors_decision
evaluate_actual(
    classified_request const& cr,
    policy const& p);

/** Add CORS headers to the response of an actual request.

    This is called after the downstream handler
    produced its response. If the origin is not
    allowed the response is left untouched; the
    browser withholds it from the caller, but the
    request was still served. Otherwise the headers
    of @ref evaluate_actual are applied, with `Vary`
    merged into any existing value.

    Decorating a response twice has the same effect
    as decorating it once.

    @param cr A request classified as @ref request_kind::actual.

    @param res The response headers produced by the handler.

    @param p The policy.

    @return `true` if headers were added.
*/
BOOST_CORS_DECL
bool
decorate(
    classified_request const& cr,
    http::fields& res,
    policy const& p);

} // cors
} // boost

#endif
