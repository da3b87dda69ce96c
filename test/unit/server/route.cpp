//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Test that header file is self-contained.
#include <boost/dispatch/server/route.hpp>

#include <stdexcept>

#include "test_suite.hpp"

namespace boost {
namespace dispatch {

struct route_test
{
    void
    testSegment()
    {
        segment lit("users");
        BOOST_TEST(! lit.is_flexible());
        BOOST_TEST(lit.get_constraint() == segment::constraint::none);
        BOOST_TEST_EQ(lit.literal(), "users");
        BOOST_TEST(! lit.matches("users"));
        BOOST_TEST_EQ(lit.to_string(), "users");

        auto any = segment::flexible();
        BOOST_TEST(any.is_flexible());
        BOOST_TEST(any.matches("x"));
        BOOST_TEST(any.matches("anything at all"));
        BOOST_TEST(! any.matches(""));
        BOOST_TEST_EQ(any.to_string(), "{any}");

        auto d = segment::digits(3);
        BOOST_TEST_EQ(d.bound(), 3u);
        BOOST_TEST(d.matches("042"));
        BOOST_TEST(! d.matches("42"));
        BOOST_TEST(! d.matches("4200"));
        BOOST_TEST(! d.matches("4a2"));
        BOOST_TEST_EQ(d.to_string(), "{digits:3}");

        auto s = segment::string(4);
        BOOST_TEST(s.matches("a"));
        BOOST_TEST(s.matches("abcd"));
        BOOST_TEST(! s.matches("abcde"));
        BOOST_TEST(! s.matches(""));
        BOOST_TEST_EQ(s.to_string(), "{string:4}");

        BOOST_TEST_THROWS(segment::digits(0), std::invalid_argument);
        BOOST_TEST_THROWS(segment::string(0), std::invalid_argument);

        BOOST_TEST(segment("a") == segment(std::string("a")));
        BOOST_TEST(! (segment("a") == segment("b")));
        BOOST_TEST(segment::digits(2) == segment::digits(2));
        BOOST_TEST(! (segment::digits(2) == segment::digits(3)));
        BOOST_TEST(! (segment::digits(2) == segment::flexible()));
        BOOST_TEST(! (segment::flexible() == segment("{any}")));
    }

    void
    testRoute()
    {
        route r{ "users", segment::digits(6), "posts", segment::flexible() };
        BOOST_TEST_EQ(r.size(), 4u);
        BOOST_TEST_EQ(r.flexible_count(), 2u);
        BOOST_TEST_EQ(r.to_string(), "/users/{digits:6}/posts/{any}");

        auto v = r.with_prefix("v2");
        BOOST_TEST_EQ(v.size(), 5u);
        BOOST_TEST_EQ(v.to_string(), "/v2/users/{digits:6}/posts/{any}");
        BOOST_TEST_EQ(r.size(), 4u);

        BOOST_TEST_EQ(route().to_string(), "/");
        BOOST_TEST_EQ(route().flexible_count(), 0u);

        BOOST_TEST(r == route({ "users", segment::digits(6),
            "posts", segment::flexible() }));
        BOOST_TEST(! (r == v));
    }

    void
    run()
    {
        testSegment();
        testRoute();
    }
};

TEST_SUITE(
    route_test,
    "boost.dispatch.server.route");

} // dispatch
} // boost
