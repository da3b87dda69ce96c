//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_SERVER_PARCEL_HPP
#define BOOST_DISPATCH_SERVER_PARCEL_HPP

#include <boost/dispatch/detail/config.hpp>
#include <any>
#include <type_traits>
#include <utility>
#include <vector>

namespace boost {
namespace dispatch {

/** Construction arguments forwarded to a handler's `setup`

    Elements are matched positionally against the
    parameters of `setup`, by exact decayed type.
*/
using parcel = std::vector<std::any>;

/** Return a parcel holding copies of the arguments

    @par Example
    @code
    struct greeter : endpoint
    {
        std::string greeting;

        void setup(std::string const& s)
        {
            greeting = s;
        }
        ...
    };

    r.add(route{"hello"}, handler_class::of<greeter>(),
        make_parcel(std::string("Hello")));
    @endcode
*/
template<class... Args>
parcel
make_parcel(Args&&... args)
{
    parcel p;
    p.reserve(sizeof...(Args));
    (p.emplace_back(std::in_place_type<
        std::decay_t<Args>>, std::forward<Args>(args)), ...);
    return p;
}

} // dispatch
} // boost

#endif
