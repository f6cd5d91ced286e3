//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CORS_CLASSIFY_HPP
#define BOOST_CORS_CLASSIFY_HPP

#include <boost/cors/detail/config.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/core/detail/string_view.hpp>
#include <string>
#include <vector>

namespace boost {
namespace cors {

/** The CORS relevance of a request.
*/
enum class request_kind
{
    /** No `Origin` header; the request is passed through untouched. */
    not_cors,

    /** An `OPTIONS` request carrying `Access-Control-Request-Method`. */
    preflight,

    /** Any other request carrying `Origin`. */
    actual
};

/** A request after classification.

    The requested method and headers are only
    filled in for preflight requests.
*/
struct classified_request
{
    /// The kind of request
    request_kind kind = request_kind::not_cors;

    /// The raw `Origin` value, empty when absent
    std::string origin;

    /// The `Access-Control-Request-Method` value
    std::string requested_method;

    /// The `Access-Control-Request-Headers` elements, in order
    std::vector<std::string> requested_headers;
};

/** Classify a request.

    The rules are applied in order:

    @li Without an `Origin` header the request is
        @ref request_kind::not_cors.
    @li An `OPTIONS` request with an
        `Access-Control-Request-Method` header is a
        @ref request_kind::preflight.
    @li Anything else is @ref request_kind::actual,
        including an `OPTIONS` request without
        `Access-Control-Request-Method`.

    Every `Access-Control-Request-Headers` field
    contributes to the requested headers. Elements
    are trimmed, and repeated names are dropped
    case-insensitively.

    @param method The request method token.

    @param fields The request headers.
*/
BOOST_CORS_DECL
classified_request
classify(
    core::string_view method,
    http::fields const& fields);

/** Classify a request.

    @param req The request header.
*/
BOOST_CORS_DECL
classified_request
classify(
    http::request_header<> const& req);

} // cors
} // boost

#endif
