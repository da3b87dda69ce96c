//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Test that header file is self-contained.
#include <boost/dispatch/server/handler_class.hpp>

#include <boost/system/system_error.hpp>
#include <stdexcept>

#include "test_suite.hpp"
#include "test_handlers.hpp"

namespace boost {
namespace dispatch {

namespace {

struct bad_table : endpoint
{
    static
    void
    methods(method_table<bad_table>& t)
    {
        t.on(method::get, &bad_table::do_get);
        t.on(method::get, &bad_table::do_get);
    }

    void do_get() {}
};

struct unknown_table : endpoint
{
    static
    void
    methods(method_table<unknown_table>& t)
    {
        t.on(method::unknown, &unknown_table::do_get);
    }

    void do_get() {}
};

} // (anon)

struct handler_class_test
{
    void
    testIdentity()
    {
        auto const& a = handler_class::of<test::echo>();
        auto const& b = handler_class::of<test::echo>();
        BOOST_TEST(&a == &b);
        BOOST_TEST(&a != &handler_class::of<test::upsidedown>());
        BOOST_TEST(a.name().find("echo") != std::string::npos);

        auto ep = a.create();
        BOOST_TEST(dynamic_cast<test::echo*>(ep.get()) != nullptr);
    }

    void
    testMethods()
    {
        auto const& h = handler_class::of<test::echo>();
        auto v = h.methods();
        BOOST_TEST_EQ(v.size(), 4u);
        if(v.size() == 4)
        {
            BOOST_TEST(v[0] == method::get);
            BOOST_TEST(v[1] == method::post);
            BOOST_TEST(v[2] == method::delete_);
            BOOST_TEST(v[3] == method::head);
        }
        BOOST_TEST(h.implements(method::get));
        BOOST_TEST(! h.implements(method::put));
        BOOST_TEST(! h.implements(method::unknown));
    }

    void
    testTableErrors()
    {
        BOOST_TEST_THROWS(handler_class::of<bad_table>(),
            std::invalid_argument);
        BOOST_TEST_THROWS(handler_class::of<unknown_table>(),
            std::invalid_argument);
    }

    void
    testCheckRoute()
    {
        auto const& up = handler_class::of<test::user_posts>();
        up.check_route(2);
        try
        {
            up.check_route(1);
            BOOST_TEST(false);
        }
        catch(system::system_error const& e)
        {
            BOOST_TEST(e.code() == error::callback_mismatch);
            BOOST_TEST(e.code() == condition::configuration_error);
        }
        BOOST_TEST_THROWS(up.check_route(3), system::system_error);

        auto const& ud = handler_class::of<test::upsidedown>();
        ud.check_route(0);
        // a captured value where the body is expected
        BOOST_TEST_THROWS(ud.check_route(1), system::system_error);
    }

    void
    testSetup()
    {
        auto const& h = handler_class::of<test::greeter>();
        auto ep = h.create();
        h.setup(*ep, make_parcel(std::string("x"), 2));
        BOOST_TEST_EQ(static_cast<test::greeter&>(*ep).greeting, "x");
        BOOST_TEST_EQ(static_cast<test::greeter&>(*ep).times, 2);

        auto mismatch = [&](parcel const& p)
        {
            try
            {
                h.setup(*ep, p);
            }
            catch(system::system_error const& e)
            {
                return e.code() == error::parcel_mismatch;
            }
            return false;
        };
        BOOST_TEST(mismatch({}));
        BOOST_TEST(mismatch(make_parcel(std::string("x"))));
        BOOST_TEST(mismatch(make_parcel(2, std::string("x"))));
        BOOST_TEST(mismatch(make_parcel("x", 2)));

        // handlers without setup only accept an empty parcel
        auto const& e = handler_class::of<test::echo>();
        auto ep2 = e.create();
        e.setup(*ep2, {});
        BOOST_TEST_THROWS(e.setup(*ep2, make_parcel(1)),
            system::system_error);
    }

    void
    testInvoke()
    {
        auto const& h = handler_class::of<test::user_posts>();
        auto ep = h.create();
        request req;
        req.add_query("page", "5");
        detail::endpoint_access::attach(*ep, req);
        h.invoke(method::get, *ep, { "ann", "7" });
        auto& res = detail::endpoint_access::get_response(*ep);
        BOOST_TEST_EQ(res.body_string(),
            R"({"user": "ann", "post": "7", "page": 5})");
    }

    void
    testCallbacks()
    {
        auto const& h = handler_class::of<test::upsidedown>();
        auto v = h.callbacks();
        BOOST_TEST_EQ(v.size(), 1u);
        if(v.size() != 1)
            return;
        BOOST_TEST(v[0].method == method::get);
        BOOST_TEST_EQ(v[0].arity, 1u);
        BOOST_TEST_EQ(v[0].sources.size(), 1u);
        BOOST_TEST_EQ(v[0].sources[0], "body");
        BOOST_TEST_EQ(v[0].may_occur.size(), 1u);
        BOOST_TEST_EQ(v[0].may_occur[0].status(), 415u);
        BOOST_TEST(v[0].produces ==
            std::type_index(typeid(test::upsidedown_response)));

        auto w = handler_class::of<test::ordering>().callbacks();
        BOOST_TEST_EQ(w.size(), 1u);
        if(w.size() != 1)
            return;
        BOOST_TEST_EQ(w[0].sources.size(), 2u);
        BOOST_TEST_EQ(w[0].sources[0], "query 'after'");
        BOOST_TEST_EQ(w[0].sources[1], "query 'before'");
        BOOST_TEST(! w[0].produces);
    }

    void
    run()
    {
        testIdentity();
        testMethods();
        testTableErrors();
        testCheckRoute();
        testSetup();
        testInvoke();
        testCallbacks();
    }
};

TEST_SUITE(
    handler_class_test,
    "boost.dispatch.server.handler_class");

} // dispatch
} // boost
