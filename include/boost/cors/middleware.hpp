//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CORS_MIDDLEWARE_HPP
#define BOOST_CORS_MIDDLEWARE_HPP

#include <boost/cors/detail/config.hpp>
#include <boost/cors/classify.hpp>
#include <boost/cors/policy.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <functional>
#include <memory>

namespace boost {
namespace cors {

/** Middleware return values

    These values determine how the caller proceeds
    after invoking the before-dispatch hook.
*/
enum class route
{
    /** The middleware declined to respond.

        The caller invokes the downstream handler,
        then the after-dispatch hook.
    */
    next,

    /** The request was handled.

        The middleware prepared the response. The
        downstream handler and the after-dispatch
        hook are not invoked.
    */
    send
};

/** Parameters object for one HTTP exchange.
*/
struct route_params
{
    /** The HTTP request message
    */
    http::request<http::string_body> req;

    /** The HTTP response message
    */
    http::response<http::string_body> res;

    /** The CORS classification of the request

        Set by @ref cors_middleware::before from the
        request as received, so later changes to
        @ref req by the handler do not affect it.
    */
    classified_request cors;
};

/** A downstream handler.
*/
using handler = std::function<void(route_params&)>;

/** Interface of a middleware wrapped around a handler.

    A host framework adapts a middleware by calling
    @ref before ahead of dispatch and, unless it
    returned @ref route::send, calling @ref after on
    the response produced by the handler.
*/
class BOOST_CORS_SYMBOL_VISIBLE
    around_middleware
{
public:
    virtual ~around_middleware() = default;

    /** Intercept a request before dispatch.
    */
    virtual
    route
    before(route_params& p) const = 0;

    /** Observe and modify the response after dispatch.
    */
    virtual
    void
    after(route_params& p) const = 0;
};

/** CORS middleware for handling cross-origin requests.

    Preflight requests are answered directly and never
    reach the handler. Actual cross-origin requests are
    dispatched normally and the CORS headers are added
    to the handler's response. Other requests pass
    through untouched.

    The request is classified once, before dispatch,
    and the result is kept in @ref route_params::cors.
    The middleware itself holds no per-request state
    and may be shared between concurrent exchanges.

    @par Example
    @code
    auto mw = std::make_shared<cors_middleware const>(
        make_policy( policy::permissive() ));

    handler h = wrap( mw,
        []( route_params& p )
        {
            p.res.result( http::status::ok );
        });
    @endcode

    @see policy, wrap
*/
class BOOST_CORS_SYMBOL_VISIBLE
    cors_middleware
    : public around_middleware
{
    std::shared_ptr<policy const> policy_;

public:
    /** Constructor

        @param p The shared policy. Must not be null.
    */
    BOOST_CORS_DECL
    explicit
    cors_middleware(
        std::shared_ptr<policy const> p);

    /** Constructor

        @throws system::system_error on invalid options.
    */
    BOOST_CORS_DECL
    explicit
    cors_middleware(cors_options opts);

    policy const&
    get_policy() const noexcept
    {
        return *policy_;
    }

    BOOST_CORS_DECL
    route
    before(route_params& p) const override;

    BOOST_CORS_DECL
    void
    after(route_params& p) const override;
};

/** Return a handler with a middleware wrapped around it.

    The returned handler calls `mw->before`, then,
    unless the middleware sent a response, `next`
    followed by `mw->after`. Exceptions thrown by
    `next` propagate and skip `after`.

    @param mw The middleware.

    @param next The downstream handler.
*/
BOOST_CORS_DECL
handler
wrap(
    std::shared_ptr<around_middleware const> mw,
    handler next);

} // cors
} // boost

#endif
