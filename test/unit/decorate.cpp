//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/cors/decorate.hpp>
#include <boost/cors/error.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <string>

#include "test_suite.hpp"

namespace boost {
namespace cors {

struct decorate_test
{
    static
    classified_request
    make_actual(core::string_view origin)
    {
        http::fields f;
        f.set(http::field::origin, origin);
        return classify("GET", f);
    }

    static
    http::response<http::string_body>
    make_response()
    {
        http::response<http::string_body> res;
        res.result(http::status::im_a_teapot);
        res.set(http::field::content_type, "text/plain");
        res.body() = "tea";
        res.prepare_payload();
        return res;
    }

    // Serialize the header fields in order
    static
    std::string
    dump(http::fields const& f)
    {
        std::string s;
        for(auto const& h : f)
        {
            s.append(h.name_string().data(), h.name_string().size());
            s += ": ";
            s.append(h.value().data(), h.value().size());
            s += "\n";
        }
        return s;
    }

    void
    test_authorized()
    {
        cors_options opts;
        opts.origins = allowed_origins::exact({ "http://www.a.com:8080" });
        opts.methods = { "GET" };
        policy p(std::move(opts));

        auto res = make_response();
        BOOST_TEST(decorate(make_actual("http://www.a.com:8080"), res, p));
        BOOST_TEST_EQ(res.result_int(), 418u);
        BOOST_TEST_EQ(res.body(), "tea");
        BOOST_TEST_EQ(res[http::field::content_type], "text/plain");
        BOOST_TEST_EQ(
            res[http::field::access_control_allow_origin],
            "http://www.a.com:8080");
        BOOST_TEST_EQ(res[http::field::vary], "Origin");

        // preflight-only headers are never added
        BOOST_TEST_EQ(res.count(http::field::access_control_allow_methods), 0u);
        BOOST_TEST_EQ(res.count(http::field::access_control_allow_headers), 0u);
        BOOST_TEST_EQ(res.count(http::field::access_control_max_age), 0u);
        BOOST_TEST_EQ(res.count(http::field::access_control_expose_headers), 0u);
        BOOST_TEST_EQ(res.count(http::field::access_control_allow_credentials), 0u);
    }

    void
    test_unauthorized()
    {
        cors_options opts;
        opts.origins = allowed_origins::exact({ "https://example.com" });
        policy p(std::move(opts));

        auto res = make_response();
        auto const before = dump(res);
        BOOST_TEST(! decorate(make_actual("https://example.com:8080"), res, p));
        BOOST_TEST_EQ(dump(res), before);
        BOOST_TEST_EQ(res.body(), "tea");

        auto const d = evaluate_actual(make_actual("null"), p);
        BOOST_TEST(d.reason == error::origin_not_allowed);
    }

    void
    test_wildcard()
    {
        policy p(policy::permissive());
        auto res = make_response();
        BOOST_TEST(decorate(make_actual("http://foo"), res, p));
        BOOST_TEST_EQ(res[http::field::access_control_allow_origin], "*");
        BOOST_TEST_EQ(res[http::field::vary], "Origin");
    }

    void
    test_credentials()
    {
        cors_options opts;
        opts.credentials = true;
        opts.exposed_headers = { "X-ExposeMe", "X-Total-Count" };
        policy p(std::move(opts));

        auto res = make_response();
        BOOST_TEST(decorate(make_actual("http://www.a.com:8080"), res, p));
        BOOST_TEST_EQ(
            res[http::field::access_control_allow_origin],
            "http://www.a.com:8080");
        BOOST_TEST_EQ(
            res[http::field::access_control_allow_credentials],
            "true");
        BOOST_TEST_EQ(
            res[http::field::access_control_expose_headers],
            "X-ExposeMe, X-Total-Count");
    }

    void
    test_vary_merge()
    {
        policy p(policy::permissive());

        auto res = make_response();
        res.set(http::field::vary, "Accept-Encoding");
        decorate(make_actual("http://foo"), res, p);
        BOOST_TEST_EQ(res[http::field::vary], "Accept-Encoding, Origin");
        BOOST_TEST_EQ(res.count(http::field::vary), 1u);

        // several Vary fields collapse into one
        res = make_response();
        res.insert(http::field::vary, "Accept");
        res.insert(http::field::vary, "accept-language, origin");
        decorate(make_actual("http://foo"), res, p);
        BOOST_TEST_EQ(res.count(http::field::vary), 1u);
        BOOST_TEST_EQ(res[http::field::vary], "Accept, accept-language, origin");

        res = make_response();
        res.set(http::field::vary, "*");
        decorate(make_actual("http://foo"), res, p);
        BOOST_TEST_EQ(res[http::field::vary], "*");
    }

    void
    test_idempotent()
    {
        cors_options opts;
        opts.origins = allowed_origins::exact({ "https://example.com" });
        opts.credentials = true;
        opts.exposed_headers = { "X-A" };
        policy p(std::move(opts));
        auto const cr = make_actual("https://example.com");

        auto once = make_response();
        once.set(http::field::vary, "Accept-Encoding");
        decorate(cr, once, p);

        auto twice = make_response();
        twice.set(http::field::vary, "Accept-Encoding");
        decorate(cr, twice, p);
        decorate(cr, twice, p);

        BOOST_TEST_EQ(dump(once), dump(twice));
        BOOST_TEST_EQ(twice.count(http::field::access_control_allow_origin), 1u);
        BOOST_TEST_EQ(twice[http::field::vary], "Accept-Encoding, Origin");
        BOOST_TEST_EQ(twice[http::field::access_control_expose_headers], "X-A");
    }

    void
    test_overwrites_stale()
    {
        // a handler's own CORS headers are replaced, not duplicated
        policy p(policy::permissive());
        auto res = make_response();
        res.set(http::field::access_control_allow_origin, "https://stale.com");
        decorate(make_actual("http://foo"), res, p);
        BOOST_TEST_EQ(res.count(http::field::access_control_allow_origin), 1u);
        BOOST_TEST_EQ(res[http::field::access_control_allow_origin], "*");
    }

    void
    run()
    {
        test_authorized();
        test_unauthorized();
        test_wildcard();
        test_credentials();
        test_vary_merge();
        test_idempotent();
        test_overwrites_stale();
    }
};

TEST_SUITE(
    decorate_test,
    "boost.cors.decorate");

} // cors
} // boost
