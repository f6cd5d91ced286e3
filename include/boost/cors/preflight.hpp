//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CORS_PREFLIGHT_HPP
#define BOOST_CORS_PREFLIGHT_HPP

#include <boost/cors/detail/config.hpp>
#include <boost/cors/classify.hpp>
#include <boost/cors/decision.hpp>
#include <boost/cors/policy.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

namespace boost {
namespace cors {

/** Check a preflight request against a policy.

    The checks run in order and the first failure
    decides the reason:

    @li the origin must be allowed,
    @li the requested method must be allowed,
        compared case-insensitively,
    @li every requested header must be allowed,
        compared case-insensitively. A single
        disallowed header rejects the preflight.
        When any header is allowed, a requested
        name that is not a valid token rejects it.

    When authorized, the headers are:

    @li `Access-Control-Allow-Origin`, the request
        origin or `*`, see @ref policy::echoes_origin
    @li `Access-Control-Allow-Credentials: true` when
        credentials are enabled
    @li `Access-Control-Allow-Methods` with every
        allowed method, in the policy's spelling
    @li `Access-Control-Allow-Headers` with every
        allowed header, or the requested headers when
        any header is allowed
    @li `Access-Control-Max-Age` when configured
    @li `Vary: Origin`

    @param cr A request classified as @ref request_kind::preflight.

    @param p The policy.
*/
BOOST_CORS_DECL
cors_decision
evaluate_preflight(
    classified_request const& cr,
    policy const& p);

/** Build the terminal response to a preflight request.

    A successful preflight produces the policy's
    preflight status, 200 by default, with the
    headers of @ref evaluate_preflight. A rejected
    preflight produces the rejection status, 403 by
    default, with no CORS headers besides
    `Vary: Origin`. The body is always empty.

    The downstream handler is never invoked for
    a preflight request.

    @param cr A request classified as @ref request_kind::preflight.

    @param p The policy.
*/
BOOST_CORS_DECL
http::response<http::string_body>
respond_preflight(
    classified_request const& cr,
    policy const& p);

} // cors
} // boost

#endif
