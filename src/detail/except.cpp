//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/detail/except.hpp>
#include <boost/dispatch/data/structured_data.hpp>
#include <boost/dispatch/error.hpp>
#include <boost/system/system_error.hpp>
#include <boost/throw_exception.hpp>
#include <stdexcept>

namespace boost {
namespace dispatch {
namespace detail {

void
throw_invalid_argument(
    char const* what,
    source_location const& loc)
{
    throw_exception(
        std::invalid_argument(what), loc);
}

void
throw_logic_error(
    char const* what,
    source_location const& loc)
{
    throw_exception(
        std::logic_error(what), loc);
}

void
throw_system_error(
    system::error_code const& ec,
    source_location const& loc)
{
    throw_exception(
        system::system_error(ec), loc);
}

void
throw_system_error(
    system::error_code const& ec,
    char const* what,
    source_location const& loc)
{
    throw_exception(
        system::system_error(ec, what), loc);
}

void
throw_validation_failed(
    std::string const& what,
    source_location const& loc)
{
    throw_exception(
        system::system_error(
            BOOST_DISPATCH_ERR(error::validation_failed),
            what), loc);
}

} // detail
} // dispatch
} // boost
