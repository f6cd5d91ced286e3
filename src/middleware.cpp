//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/cors/middleware.hpp>
#include <boost/cors/classify.hpp>
#include <boost/cors/decorate.hpp>
#include <boost/cors/preflight.hpp>
#include <boost/cors/detail/except.hpp>
#include <utility>

namespace boost {
namespace cors {

cors_middleware::
cors_middleware(
    std::shared_ptr<policy const> p)
    : policy_(std::move(p))
{
    if(! policy_)
        detail::throw_invalid_argument();
}

cors_middleware::
cors_middleware(cors_options opts)
    : policy_(make_policy(std::move(opts)))
{
}

route
cors_middleware::
before(route_params& p) const
{
    p.cors = classify(p.req);
    if(p.cors.kind != request_kind::preflight)
        return route::next;
    auto const version = p.req.version();
    p.res = respond_preflight(p.cors, *policy_);
    p.res.version(version);
    return route::send;
}

void
cors_middleware::
after(route_params& p) const
{
    if(p.cors.kind != request_kind::actual)
        return;
    decorate(p.cors, p.res, *policy_);
}

handler
wrap(
    std::shared_ptr<around_middleware const> mw,
    handler next)
{
    if(! mw || ! next)
        detail::throw_invalid_argument();
    return
        [mw = std::move(mw), next = std::move(next)](
            route_params& p)
        {
            if(mw->before(p) == route::send)
                return;
            next(p);
            mw->after(p);
        };
}

} // cors
} // boost
