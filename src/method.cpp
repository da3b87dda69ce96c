//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/method.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <boost/assert.hpp>

namespace boost {
namespace dispatch {

method
string_to_method(
    core::string_view s) noexcept
{
    for(std::size_t i = 1; i <= method_count; ++i)
    {
        auto const m = static_cast<method>(i);
        if(grammar::ci_is_equal(s, to_string(m)))
            return m;
    }
    return method::unknown;
}

core::string_view
to_string(method m) noexcept
{
    switch(m)
    {
    case method::get:       return "GET";
    case method::post:      return "POST";
    case method::put:       return "PUT";
    case method::delete_:   return "DELETE";
    case method::head:      return "HEAD";
    case method::options:   return "OPTIONS";
    case method::patch:     return "PATCH";
    case method::trace:     return "TRACE";
    default:
        break;
    }
    BOOST_ASSERT(m == method::unknown);
    return "<unknown>";
}

} // dispatch
} // boost
