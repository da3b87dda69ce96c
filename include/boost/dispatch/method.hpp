//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_METHOD_HPP
#define BOOST_DISPATCH_METHOD_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>

namespace boost {
namespace dispatch {

/** HTTP request methods understood by the dispatcher

    The order of the enumerators is the order in which
    methods are listed in an `Allow` header.
*/
enum class method : unsigned char
{
    /** An unknown method.

        This value indicates that the request method string
        is not one of the recognized methods.
    */
    unknown = 0,

    get,
    post,
    put,
    delete_,
    head,
    options,
    patch,
    trace
};

/// The number of recognized methods, excluding `unknown`
constexpr std::size_t method_count = 8;

/** Convert a method string to the enumeration.

    The comparison is case-insensitive.

    @return The method, or @ref method::unknown.
*/
BOOST_DISPATCH_DECL
method
string_to_method(
    core::string_view s) noexcept;

/** Return the canonical upper-case token for a method.

    @par Preconditions
    @code
    m != method::unknown
    @endcode
*/
BOOST_DISPATCH_DECL
core::string_view
to_string(method m) noexcept;

} // dispatch
} // boost

#endif
