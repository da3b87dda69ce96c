//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Test that header file is self-contained.
#include <boost/dispatch/request.hpp>

#include <boost/dispatch/error.hpp>
#include <boost/system/system_error.hpp>
#include <algorithm>
#include <cstring>
#include <memory>

#include "test_suite.hpp"

namespace boost {
namespace dispatch {

struct request_test
{
    // a reader handing out `s` in pieces of at most `step` bytes
    static
    request::body_reader
    make_reader(
        std::string s,
        std::size_t step)
    {
        auto pos = std::make_shared<std::size_t>(0);
        return [s, step, pos](char* dest, std::size_t n)
        {
            auto const k = (std::min)({ n, step, s.size() - *pos });
            std::memcpy(dest, s.data() + *pos, k);
            *pos += k;
            return k;
        };
    }

    void
    testFromTarget()
    {
        auto rv = request::from_target(
            "get", "/users/a%20b/posts?page=2&q=x%26y&page=3");
        BOOST_TEST(rv.has_value());
        if(! rv)
            return;
        auto& req = *rv;
        BOOST_TEST(req.method() == method::get);
        BOOST_TEST_EQ(req.method_string(), "get");
        BOOST_TEST_EQ(req.segments().size(), 3u);
        BOOST_TEST_EQ(req.segments()[1], "a b");
        BOOST_TEST_EQ(req.query().size(), 3u);
        BOOST_TEST_EQ(req.query()[1].second, "x&y");

        auto v = req.query_values("page");
        BOOST_TEST_EQ(v.size(), 2u);
        BOOST_TEST_EQ(v[1], "3");
        BOOST_TEST(req.query_values("PAGE").empty());

        rv = request::from_target("GET", "/");
        BOOST_TEST(rv.has_value() && rv->segments().empty());

        BOOST_TEST(request::from_target("GET", "users").has_error());
        BOOST_TEST(request::from_target("GET", "/a b").has_error());
    }

    void
    testMethod()
    {
        request req;
        req.set_method("BREW");
        BOOST_TEST(req.method() == method::unknown);
        BOOST_TEST_EQ(req.method_string(), "BREW");
    }

    void
    testBody()
    {
        request req;
        BOOST_TEST(req.body().empty());

        req.set_body("hello");
        BOOST_TEST(req.content_length() == 5u);
        BOOST_TEST_EQ(req.body(), "hello");

        req.set_body_limit(4);
        try
        {
            req.body();
            BOOST_TEST(false);
        }
        catch(system::system_error const& e)
        {
            BOOST_TEST(e.code() == error::body_too_large);
        }
    }

    void
    testBodyReader()
    {
        std::string const big(10000, 'x');

        request req;
        req.set_body_reader(make_reader(big, 3000));
        BOOST_TEST(! req.content_length());
        BOOST_TEST_EQ(req.body().size(), big.size());
        // cached after the first read
        BOOST_TEST_EQ(req.body().size(), big.size());

        // actual size over the limit
        request r2;
        r2.set_body_limit(9999);
        r2.set_body_reader(make_reader(big, 4096));
        BOOST_TEST_THROWS(r2.body(), system::system_error);

        // declared size over the limit, nothing is pulled
        bool pulled = false;
        request r3;
        r3.set_body_limit(10);
        r3.set_body_reader(
            [&pulled](char*, std::size_t)
            {
                pulled = true;
                return std::size_t(0);
            }, 11);
        BOOST_TEST_THROWS(r3.body(), system::system_error);
        BOOST_TEST(! pulled);
    }

    void
    testContentType()
    {
        request req;
        BOOST_TEST(! get_content_type(req));
        req.headers().append("Content-Type", "not a type");
        BOOST_TEST(! get_content_type(req));
        req.headers().set("content_type", "Text/Plain; charset=UTF-8");
        auto ct = get_content_type(req);
        BOOST_TEST(ct.has_value());
        if(ct)
        {
            BOOST_TEST_EQ(ct->media_type, "text/plain");
            BOOST_TEST(ct->charset == std::string("utf-8"));
        }
    }

    void
    run()
    {
        testFromTarget();
        testMethod();
        testBody();
        testBodyReader();
        testContentType();
    }
};

TEST_SUITE(
    request_test,
    "boost.dispatch.request");

} // dispatch
} // boost
