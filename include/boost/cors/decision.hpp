//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CORS_DECISION_HPP
#define BOOST_CORS_DECISION_HPP

#include <boost/cors/detail/config.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/system/error_code.hpp>

namespace boost {
namespace cors {

/** The result of checking a request against a policy.

    A decision is either authorized, in which case
    @ref headers holds the CORS response headers to
    add, or rejected, in which case @ref reason holds
    one of @ref error::origin_not_allowed,
    @ref error::method_not_allowed or
    @ref error::header_not_allowed.

    A rejection is an expected outcome, not a fault.
*/
struct cors_decision
{
    /// The rejection reason, or success
    system::error_code reason;

    /// The headers to add when authorized
    http::fields headers;

    /** Return true if the request is authorized.
    */
    bool
    authorized() const noexcept
    {
        return ! reason.failed();
    }
};

/** Apply the headers of a decision to a response.

    Every field of the decision replaces any field
    of the same name in `res`, except `Vary`, which
    is merged with the existing value. Fields not
    named by the decision are left alone. Applying
    the same decision twice has the same effect as
    applying it once.

    Nothing is applied for a rejected decision.

    @param d The decision.

    @param res The response headers to modify.
*/
BOOST_CORS_DECL
void
apply(
    cors_decision const& d,
    http::fields& res);

} // cors
} // boost

#endif
