//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_CONFIG_HPP
#define BOOST_DISPATCH_CONFIG_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/dispatch/error_info.hpp>
#include <spdlog/fwd.h>

#include <cstddef>
#include <memory>

namespace boost {
namespace dispatch {

/** Dispatcher configuration settings.

    @see @ref make_dispatcher_config,
         @ref dispatcher.
*/
struct dispatcher_config
{
    /** Maximum request body size.

        Reading a larger body answers 413.
        This cannot be zero.
    */
    std::size_t body_limit = 64 * 1024;

    /** The response for paths matching no route.
    */
    error_info not_found = not_found_error();

    /** The logger used by the dispatcher.

        When null, the default spdlog logger is used.
    */
    std::shared_ptr<spdlog::logger> log;
};

/** Return a validated, immutable configuration.

    @throw std::invalid_argument if a setting is out of range.
*/
BOOST_DISPATCH_DECL
std::shared_ptr<dispatcher_config const>
make_dispatcher_config(dispatcher_config cfg = {});

} // dispatch
} // boost

#endif
