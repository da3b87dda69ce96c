//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/server/statuses.hpp>

namespace boost {
namespace dispatch {
namespace statuses {

bool
is_empty( unsigned code ) noexcept
{
    if( code >= 100 && code < 200 )
        return true;
    switch( code )
    {
    case 204: // No Content
    case 205: // Reset Content
    case 304: // Not Modified
        return true;
    default:
        return false;
    }
}

bool
is_error( unsigned code ) noexcept
{
    return code >= 400;
}

} // statuses
} // dispatch
} // boost
