//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/cors/classify.hpp>

#include "test_suite.hpp"

namespace boost {
namespace cors {

struct classify_test
{
    void
    test_not_cors()
    {
        http::fields f;
        f.set(http::field::host, "example.com");
        BOOST_TEST(classify("GET", f).kind == request_kind::not_cors);
        BOOST_TEST(classify("OPTIONS", f).kind == request_kind::not_cors);

        // preflight fields without Origin do not count
        f.set(http::field::access_control_request_method, "PUT");
        auto const cr = classify("OPTIONS", f);
        BOOST_TEST(cr.kind == request_kind::not_cors);
        BOOST_TEST(cr.origin.empty());
        BOOST_TEST(cr.requested_method.empty());
    }

    void
    test_actual()
    {
        http::fields f;
        f.set(http::field::origin, "http://foo");
        auto cr = classify("GET", f);
        BOOST_TEST(cr.kind == request_kind::actual);
        BOOST_TEST_EQ(cr.origin, "http://foo");

        // only OPTIONS can be a preflight
        f.set(http::field::access_control_request_method, "PUT");
        cr = classify("POST", f);
        BOOST_TEST(cr.kind == request_kind::actual);
        BOOST_TEST(cr.requested_method.empty());
    }

    void
    test_plain_options()
    {
        // OPTIONS with Origin but no request method
        http::fields f;
        f.set(http::field::origin, "http://a.com");
        f.set(http::field::access_control_request_headers, "X-A");
        auto const cr = classify("OPTIONS", f);
        BOOST_TEST(cr.kind == request_kind::actual);
        BOOST_TEST(cr.requested_headers.empty());
    }

    void
    test_preflight()
    {
        http::fields f;
        f.set(http::field::origin, "http://foo");
        f.set(http::field::access_control_request_method, "PUT");
        auto cr = classify("OPTIONS", f);
        BOOST_TEST(cr.kind == request_kind::preflight);
        BOOST_TEST_EQ(cr.origin, "http://foo");
        BOOST_TEST_EQ(cr.requested_method, "PUT");
        BOOST_TEST(cr.requested_headers.empty());

        f.set(http::field::access_control_request_headers,
            " X-Token , content-type,,x-token ");
        f.insert(http::field::access_control_request_headers,
            "Authorization, Content-Type");
        cr = classify("OPTIONS", f);
        BOOST_TEST(cr.kind == request_kind::preflight);
        BOOST_TEST_EQ(cr.requested_headers.size(), 3u);
        if(cr.requested_headers.size() == 3)
        {
            BOOST_TEST_EQ(cr.requested_headers[0], "X-Token");
            BOOST_TEST_EQ(cr.requested_headers[1], "content-type");
            BOOST_TEST_EQ(cr.requested_headers[2], "Authorization");
        }
    }

    void
    test_case_insensitive_fields()
    {
        http::fields f;
        f.insert("origin", "http://foo");
        f.insert("ACCESS-CONTROL-REQUEST-METHOD", "delete");
        auto const cr = classify("OPTIONS", f);
        BOOST_TEST(cr.kind == request_kind::preflight);
        BOOST_TEST_EQ(cr.requested_method, "delete");
    }

    void
    test_request_header()
    {
        http::request_header<> req;
        req.method(http::verb::options);
        req.target("/a");
        req.set(http::field::origin, "http://www.a.com:8080");
        req.set(http::field::access_control_request_method, "GET");
        BOOST_TEST(classify(req).kind == request_kind::preflight);

        req.method(http::verb::get);
        BOOST_TEST(classify(req).kind == request_kind::actual);

        req.erase(http::field::origin);
        BOOST_TEST(classify(req).kind == request_kind::not_cors);
    }

    void
    run()
    {
        test_not_cors();
        test_actual();
        test_plain_options();
        test_preflight();
        test_case_insensitive_fields();
        test_request_header();
    }
};

TEST_SUITE(
    classify_test,
    "boost.cors.classify");

} // cors
} // boost
