//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_DETAIL_WRITE_JSON_HPP
#define BOOST_DISPATCH_DETAIL_WRITE_JSON_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/json/value.hpp>
#include <string>

namespace boost {
namespace dispatch {
namespace detail {

/** Return the wire text of a JSON value

    Every JSON body the library emits goes
    through this function. Members are separated
    by `", "` and keys by `": "`, object members
    keep their insertion order, and all text
    outside printable ASCII is written as
    `\uXXXX` escapes (surrogate pairs above the
    BMP). Doubles use the shortest representation
    which round-trips, always carrying a fraction
    or an exponent, so `1.0` stays `1.0`.
*/
BOOST_DISPATCH_DECL
std::string
write_json(json::value const& jv);

} // detail
} // dispatch
} // boost

#endif
