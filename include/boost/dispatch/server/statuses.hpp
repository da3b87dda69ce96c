//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_SERVER_STATUSES_HPP
#define BOOST_DISPATCH_SERVER_STATUSES_HPP

#include <boost/dispatch/detail/config.hpp>

namespace boost {
namespace dispatch {

/** HTTP status code utilities.

    @par Example
    @code
    // Check if a response should have no body
    if( statuses::is_empty( 204 ) )
    {
        // Don't send Content-Length or body
    }
    @endcode
*/
namespace statuses {

/** Check if a status code indicates an empty response body.

    Responses with these status codes must not include a
    message body. This includes:

    @li 1xx Informational
    @li 204 No Content
    @li 205 Reset Content
    @li 304 Not Modified

    @param code The HTTP status code to check.

    @return `true` if responses with this code should have
    no body, `false` otherwise.
*/
BOOST_DISPATCH_DECL
bool
is_empty(unsigned code) noexcept;

/** Check if a status code is a client or server error.

    @param code The HTTP status code to check.

    @return `true` if `code` is 400 or above.
*/
BOOST_DISPATCH_DECL
bool
is_error(unsigned code) noexcept;

} // statuses
} // dispatch
} // boost

#endif
