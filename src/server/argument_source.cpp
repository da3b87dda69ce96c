//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/server/argument_source.hpp>

namespace boost {
namespace dispatch {

argument_source::
~argument_source() = default;

namespace detail {

std::vector<std::string>
raw_values(
    request const& req,
    value_origin origin,
    std::string const& name)
{
    if(origin == value_origin::header)
        return req.headers().find_all(name);
    return req.query_values(name);
}

std::string
describe_origin(
    value_origin origin,
    std::string const& name)
{
    if(origin == value_origin::header)
        return "header '" + name + "'";
    return "query '" + name + "'";
}

} // detail

} // dispatch
} // boost
