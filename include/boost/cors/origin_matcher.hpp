//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CORS_ORIGIN_MATCHER_HPP
#define BOOST_CORS_ORIGIN_MATCHER_HPP

#include <boost/cors/detail/config.hpp>
#include <boost/cors/origin.hpp>
#include <boost/cors/policy.hpp>
#include <boost/core/detail/string_view.hpp>

namespace boost {
namespace cors {

/** Decides whether a request origin is allowed.

    The matcher refers to the origin rule of a
    policy, which must outlive it.

    @li The any rule allows every origin, and the
        null origin unless it was disabled.
    @li The exact rule allows an origin equal to a
        listed origin; `null` only if listed.
    @li The predicate rule asks the predicate.

    An `Origin` value which does not parse is only
    allowed by the any rule.
*/
class origin_matcher
{
    allowed_origins const* rule_;

public:
    explicit
    origin_matcher(
        allowed_origins const& rule) noexcept
        : rule_(&rule)
    {
    }

    explicit
    origin_matcher(
        policy const& p) noexcept
        : rule_(&p.origins())
    {
    }

    /** Return true if the origin is allowed.

        @param o The parsed origin.
    */
    BOOST_CORS_DECL
    bool
    matches(origin const& o) const;

    /** Return true if the `Origin` header value is allowed.

        @param value The raw `Origin` header value.
    */
    BOOST_CORS_DECL
    bool
    matches(core::string_view value) const;
};

} // cors
} // boost

#endif
