//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Test that header file is self-contained.
#include <boost/dispatch/server/argument_source.hpp>

#include <boost/dispatch/data/binary_data.hpp>
#include <boost/dispatch/data/json_data.hpp>
#include <boost/dispatch/error.hpp>
#include <boost/system/system_error.hpp>

#include "test_suite.hpp"

namespace boost {
namespace dispatch {

namespace {

struct count_input : json_data
{
    static
    schema const&
    get_schema()
    {
        static schema const s = schema()
            .required("n", field_type::integer());
        return s;
    }

    count_input(
        core::string_view raw,
        std::optional<content_type> const& ct)
        : json_data(raw, ct, get_schema())
    {
    }
};

// returns the status of the thrown error_info, or 0
template<class F>
unsigned
thrown_status(F const& f)
{
    try
    {
        f();
    }
    catch(error_info const& e)
    {
        return e.status();
    }
    return 0;
}

} // (anon)

struct argument_source_test
{
    void
    testDefault()
    {
        request req;
        req.headers().append("X-Tag", "a");
        req.headers().append("x-tag", "b");

        auto src = header_of("x_tag");
        BOOST_TEST(src.value_type() == typeid(std::optional<std::string>));
        BOOST_TEST(src.errors().empty());
        BOOST_TEST_EQ(src.describe(), "header 'x_tag'");

        auto v = std::any_cast<std::optional<std::string>>(
            src.extract(req));
        BOOST_TEST(v == std::string("a"));

        auto none = std::any_cast<std::optional<std::string>>(
            header_of("Missing").extract(req));
        BOOST_TEST(! none);
    }

    void
    testRequired()
    {
        request req;
        req.headers().append("Authorization", "secret");

        auto src = header_of("authorization").required();
        BOOST_TEST(src.value_type() == typeid(std::string));
        BOOST_TEST_EQ(src.errors().size(), 1u);
        BOOST_TEST_EQ(
            std::any_cast<std::string>(src.extract(req)), "secret");

        auto missing = header_of("X-Token").required(error_info(401));
        BOOST_TEST_EQ(thrown_status(
            [&]{ missing.extract(req); }), 401u);
        BOOST_TEST_EQ(thrown_status(
            [&]{ header_of("X").required().extract(req); }), 400u);
    }

    void
    testUnique()
    {
        request req;
        req.add_query("page", "1");
        req.add_query("page", "2");
        req.add_query("q", "x");

        auto src = query_of("page").unique(error_info(422));
        BOOST_TEST_EQ(thrown_status(
            [&]{ src.extract(req); }), 422u);

        auto q = std::any_cast<std::optional<std::string>>(
            query_of("q").unique().extract(req));
        BOOST_TEST(q == std::string("x"));

        // the default error for repeats is its own 400
        auto d = query_of("page").unique();
        BOOST_TEST_EQ(thrown_status(
            [&]{ d.extract(req); }), 400u);
        BOOST_TEST_EQ(d.errors().size(), 1u);
        BOOST_TEST_EQ(d.errors()[0].status(), 400u);

        // and does not depend on the value's origin
        request hr;
        hr.headers().append("Accept", "text/plain");
        hr.headers().append("Accept", "text/html");
        BOOST_TEST_EQ(thrown_status([&]{
            header_of("Accept").unique().extract(hr); }), 400u);

        // absent is fine without required
        auto z = std::any_cast<std::optional<std::string>>(
            query_of("z").unique().extract(req));
        BOOST_TEST(! z);

        // query names are case-sensitive
        BOOST_TEST(! std::any_cast<std::optional<std::string>>(
            query_of("Q").extract(req)));
    }

    void
    testAll()
    {
        request req;
        req.add_query("id", "3");
        req.add_query("id", "1");

        auto src = query_of("id").all();
        BOOST_TEST(src.value_type() == typeid(std::vector<std::string>));
        auto v = std::any_cast<std::vector<std::string>>(
            src.extract(req));
        BOOST_TEST_EQ(v.size(), 2u);
        BOOST_TEST_EQ(v[0], "3");

        auto e = std::any_cast<std::vector<std::string>>(
            query_of("none").all().extract(req));
        BOOST_TEST(e.empty());
    }

    void
    testMap()
    {
        request req;
        req.add_query("n", "41");
        req.add_query("ids", "1");
        req.add_query("ids", "2");

        auto to_int = [](std::string const& s) { return std::stoi(s); };

        auto n = query_of("n").map(to_int);
        BOOST_TEST(n.value_type() == typeid(std::optional<int>));
        BOOST_TEST(std::any_cast<std::optional<int>>(
            n.extract(req)) == 41);

        auto r = query_of("n").required().map(to_int)
            .map([](int i) { return i + 1; });
        BOOST_TEST(r.value_type() == typeid(int));
        BOOST_TEST_EQ(std::any_cast<int>(r.extract(req)), 42);

        auto ids = query_of("ids").map(to_int).all();
        BOOST_TEST(ids.value_type() == typeid(std::vector<int>));
        auto v = std::any_cast<std::vector<int>>(ids.extract(req));
        BOOST_TEST_EQ(v.size(), 2u);
        BOOST_TEST_EQ(v[1], 2);

        // conversion failures propagate unchanged
        req.add_query("bad", "x");
        BOOST_TEST_THROWS(
            query_of("bad").map(to_int).extract(req),
            std::invalid_argument);
    }

    void
    testBody()
    {
        request req;
        req.headers().append("Content-Type", "application/json");
        req.set_body(R"({"n":7})");

        auto src = body_of<count_input>();
        BOOST_TEST(src.value_type() == typeid(count_input));
        BOOST_TEST_EQ(src.describe(), "body");
        BOOST_TEST_EQ(src.errors().size(), 1u);
        BOOST_TEST_EQ(src.errors()[0].status(), 415u);
        auto v = std::any_cast<count_input>(src.extract(req));
        BOOST_TEST(v.value().at("n") == 7);

        request bad;
        bad.headers().append("Content-Type", "application/json");
        bad.set_body(R"({"n":"7"})");
        BOOST_TEST_EQ(thrown_status(
            [&]{ src.extract(bad); }), 415u);
        BOOST_TEST_EQ(thrown_status(
            [&]{ body_of<count_input>(error_info(422))
                .extract(bad); }), 422u);

        // the body limit is not a validation failure
        request big;
        big.set_body("0123456789");
        big.set_body_limit(4);
        try
        {
            body_of<binary_data>().extract(big);
            BOOST_TEST(false);
        }
        catch(system::system_error const& e)
        {
            BOOST_TEST(e.code() == error::body_too_large);
        }
    }

    void
    run()
    {
        testDefault();
        testRequired();
        testUnique();
        testAll();
        testMap();
        testBody();
    }
};

TEST_SUITE(
    argument_source_test,
    "boost.dispatch.server.argument_source");

} // dispatch
} // boost
