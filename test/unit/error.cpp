//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Test that header file is self-contained.
#include <boost/dispatch/error.hpp>

#include <cstring>
#include <memory>
#include <type_traits>

#include "test_suite.hpp"

namespace boost {
namespace dispatch {

struct error_test
{
    void
    check(
        char const* name,
        error ev)
    {
        auto const ec = make_error_code(ev);
        BOOST_TEST_EQ(std::strcmp(ec.category().name(), name), 0);
        BOOST_TEST(! ec.message().empty());
        BOOST_TEST(ec.failed());
        BOOST_TEST(
            std::addressof(ec.category()) ==
            std::addressof(make_error_code(ev).category()));
        BOOST_TEST(ec.category().equivalent(
            static_cast<std::underlying_type<
                error>::type>(ev),
                    ec.category().default_error_condition(
                        static_cast<std::underlying_type<
                            error>::type>(ev))));
        BOOST_TEST(ec.category().equivalent(ec,
            static_cast<std::underlying_type<
                error>::type>(ev)));
    }

    void
    check(
        char const* name,
        condition c,
        error ev)
    {
        auto const ec = make_error_code(ev);
        BOOST_TEST_EQ(std::strcmp(ec.category().name(), name), 0);
        BOOST_TEST(ec == c);
        BOOST_TEST(c == ec);
    }

    void
    run()
    {
        char const* const n = "boost.dispatch";

        check(n, error::not_found);
        check(n, error::method_not_allowed);
        check(n, error::validation_failed);
        check(n, error::duplicate_route);
        check(n, error::parcel_mismatch);
        check(n, error::callback_mismatch);
        check(n, error::double_response);
        check(n, error::no_response);
        check(n, error::body_too_large);

        check(n, condition::configuration_error, error::duplicate_route);
        check(n, condition::configuration_error, error::parcel_mismatch);
        check(n, condition::configuration_error, error::callback_mismatch);
        check(n, condition::protocol_violation, error::double_response);
        check(n, condition::protocol_violation, error::no_response);

        BOOST_TEST(make_error_code(error::not_found) !=
            condition::configuration_error);
        BOOST_TEST(make_error_code(error::body_too_large) !=
            condition::protocol_violation);
        BOOST_TEST_EQ(make_error_code(error::not_found).message(),
            "route not found");
    }
};

TEST_SUITE(
    error_test,
    "boost.dispatch.error");

} // dispatch
} // boost
