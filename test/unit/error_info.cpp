//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Test that header file is self-contained.
#include <boost/dispatch/error_info.hpp>

#include <boost/json/parse.hpp>

#include "test_suite.hpp"

namespace boost {
namespace dispatch {

struct error_info_test
{
    void
    testPlain()
    {
        error_info e;
        BOOST_TEST_EQ(e.status(), 400u);
        BOOST_TEST(e.body().empty());
        BOOST_TEST(! e.body_type());

        auto res = e.to_response();
        BOOST_TEST_EQ(res.status(), 400u);
        BOOST_TEST(res.body().empty());
        BOOST_TEST(! res.headers().exists("Content-Type"));
        BOOST_TEST(! res.headers().exists("Content-Length"));
    }

    void
    testBody()
    {
        error_info e(409, "conflict");
        e.add_header("Retry-After", "5")
         .add_header("X-Trace", "t");
        auto res = e.to_response();
        BOOST_TEST_EQ(res.status(), 409u);
        BOOST_TEST_EQ(res.body_string(), "conflict");
        BOOST_TEST_EQ(res.headers().value_or("Content-Type"), "text/plain");
        BOOST_TEST_EQ(res.headers().value_or("Content-Length"), "8");
        BOOST_TEST_EQ(res.headers().value_or("Retry-After"), "5");
        BOOST_TEST_EQ(res.headers().value_or("X-Trace"), "t");

        // thrown and caught as a standard exception
        try
        {
            throw e;
        }
        catch(std::exception const& ex)
        {
            BOOST_TEST(std::string(ex.what()).find("409") !=
                std::string::npos);
        }
    }

    void
    testPredefined()
    {
        BOOST_TEST_EQ(not_found_error().status(), 404u);
        BOOST_TEST_EQ(unsupported_media_type_error().status(), 415u);
        BOOST_TEST_EQ(header_not_found_error().status(), 400u);
        BOOST_TEST_EQ(payload_too_large_error().status(), 413u);

        method_not_allowed_error e({ method::get, method::post });
        BOOST_TEST_EQ(e.status(), 405u);
        BOOST_TEST_EQ(e.headers().value_or("Allow"), "GET, POST");
        BOOST_TEST(e.body().empty());

        // slicing keeps everything
        error_info copy = e;
        BOOST_TEST_EQ(copy.to_response().headers().value_or("Allow"),
            "GET, POST");
    }

    void
    testApi()
    {
        api_error_info e(422, { 1001, "field x is bad", "Try again", {} });
        BOOST_TEST_EQ(e.status(), 422u);
        BOOST_TEST_EQ(e.body(),
            R"({"code": 1001, "developerMessage": "field x is bad", )"
            R"("userMessage": "Try again", "info": null})");
        BOOST_TEST_EQ(e.to_response().headers().value_or("Content-Type"),
            "application/json; charset=UTF-8");

        api_error_info empty(500, {});
        auto jv = json::parse(empty.body());
        BOOST_TEST(jv.as_object().at("code").is_null());
        BOOST_TEST(jv.as_object().at("userMessage").is_null());
    }

    void
    run()
    {
        testPlain();
        testBody();
        testPredefined();
        testApi();
    }
};

TEST_SUITE(
    error_info_test,
    "boost.dispatch.error_info");

} // dispatch
} // boost
