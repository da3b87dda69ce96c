//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/response.hpp>

namespace boost {
namespace dispatch {

std::string
response::
body_string() const
{
    std::size_t n = 0;
    for(auto const& s : body_)
        n += s.size();
    std::string r;
    r.reserve(n);
    for(auto const& s : body_)
        r.append(s);
    return r;
}

} // dispatch
} // boost
