//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_DETAIL_EXCEPT_HPP
#define BOOST_DISPATCH_DETAIL_EXCEPT_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>

namespace boost {
namespace dispatch {
namespace detail {

BOOST_DISPATCH_DECL
BOOST_NORETURN
void
throw_invalid_argument(
    char const* what = "invalid argument",
    source_location const& loc =
        BOOST_CURRENT_LOCATION);

BOOST_DISPATCH_DECL
BOOST_NORETURN
void
throw_logic_error(
    char const* what = "logic error",
    source_location const& loc =
        BOOST_CURRENT_LOCATION);

BOOST_DISPATCH_DECL
BOOST_NORETURN
void
throw_system_error(
    system::error_code const& ec,
    source_location const& loc =
        BOOST_CURRENT_LOCATION);

BOOST_DISPATCH_DECL
BOOST_NORETURN
void
throw_system_error(
    system::error_code const& ec,
    char const* what,
    source_location const& loc =
        BOOST_CURRENT_LOCATION);

} // detail
} // dispatch
} // boost

#endif
