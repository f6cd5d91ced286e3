//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/cors/token_set.hpp>

#include "test_suite.hpp"

namespace boost {
namespace cors {

struct token_set_test
{
    void
    test_set()
    {
        token_set ts;
        BOOST_TEST(ts.empty());
        BOOST_TEST(ts.insert("Content-Type"));
        BOOST_TEST(ts.insert("X-Requested-With"));
        BOOST_TEST(! ts.insert("content-type"));
        BOOST_TEST_EQ(ts.size(), 2u);

        BOOST_TEST(ts.contains("CONTENT-TYPE"));
        BOOST_TEST(ts.contains("x-requested-with"));
        BOOST_TEST(! ts.contains("Authorization"));
        BOOST_TEST(! ts.contains(""));

        // stored spelling is kept
        BOOST_TEST_EQ(ts.find("content-type"), "Content-Type");
        BOOST_TEST(ts.find("Authorization").empty());

        BOOST_TEST_EQ(ts.join(), "Content-Type, X-Requested-With");
        BOOST_TEST_EQ(ts.join(","), "Content-Type,X-Requested-With");
    }

    void
    test_init()
    {
        token_set ts({ "GET", "get", "POST" });
        BOOST_TEST_EQ(ts.size(), 2u);
        BOOST_TEST_EQ(ts.join(), "GET, POST");
        BOOST_TEST_EQ(token_set().join(), "");
    }

    void
    test_is_token()
    {
        BOOST_TEST(is_token("GET"));
        BOOST_TEST(is_token("X-Custom_Header.1"));
        BOOST_TEST(is_token("*"));
        BOOST_TEST(! is_token(""));
        BOOST_TEST(! is_token("X Header"));
        BOOST_TEST(! is_token("X-Header:"));
        BOOST_TEST(! is_token("a,b"));
    }

    void
    test_tchars()
    {
        BOOST_TEST(is_token("!#$%&'*+-.^_`|~"));
        BOOST_TEST(is_token("azAZ09"));
        BOOST_TEST(! is_token("\"quoted\""));
        BOOST_TEST(! is_token("a/b"));
        BOOST_TEST(! is_token("a\tb"));
        BOOST_TEST(! is_token("caf\xc3\xa9"));
    }

    void
    test_case_folding()
    {
        token_set ts({ "X-Custom" });
        BOOST_TEST(ts.contains("x-custom"));
        BOOST_TEST(ts.contains("X-CUSTOM"));
        BOOST_TEST(! ts.contains("X-Custom2"));
        BOOST_TEST(! ts.contains("X_Custom"));
        BOOST_TEST(! ts.insert("x-CUSTOM"));
        BOOST_TEST_EQ(ts.join(), "X-Custom");
    }

    void
    test_split_list()
    {
        auto v = split_list(" X-A ,, x-b\t,");
        BOOST_TEST_EQ(v.size(), 2u);
        BOOST_TEST_EQ(v[0], "X-A");
        BOOST_TEST_EQ(v[1], "x-b");

        BOOST_TEST(split_list("").empty());
        BOOST_TEST(split_list(" , ").empty());

        v = split_list("content-type");
        BOOST_TEST_EQ(v.size(), 1u);
        BOOST_TEST_EQ(v[0], "content-type");
    }

    void
    test_merge_vary()
    {
        BOOST_TEST_EQ(merge_vary("", "Origin"), "Origin");
        BOOST_TEST_EQ(
            merge_vary("Accept-Encoding", "Origin"),
            "Accept-Encoding, Origin");
        BOOST_TEST_EQ(
            merge_vary("Accept-Encoding, origin", "Origin"),
            "Accept-Encoding, origin");
        BOOST_TEST_EQ(
            merge_vary("Accept, Accept", "Origin"),
            "Accept, Origin");
        BOOST_TEST_EQ(merge_vary("*", "Origin"), "*");
    }

    void
    run()
    {
        test_set();
        test_init();
        test_is_token();
        test_tchars();
        test_case_folding();
        test_split_list();
        test_merge_vary();
    }
};

TEST_SUITE(
    token_set_test,
    "boost.cors.token_set");

} // cors
} // boost
