//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_DATA_STRUCTURED_DATA_HPP
#define BOOST_DISPATCH_DATA_STRUCTURED_DATA_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/dispatch/rfc/content_type.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/assert/source_location.hpp>
#include <concepts>
#include <optional>
#include <string>

namespace boost {
namespace dispatch {

/** A type constructible from a raw payload

    Construction is validation: a type models this
    concept when it can be built from the raw body
    bytes and the request's parsed Content-Type, and
    throws `system::system_error` with
    @ref error::validation_failed when the payload
    does not conform.

    @see
        @ref binary_data,
        @ref json_data,
        @ref form_data.
*/
template<class T>
concept structured_data =
    std::constructible_from<T,
        core::string_view,
        std::optional<content_type> const&>;

/** A type which can be sent as a response body
*/
template<class T>
concept serializable_data = requires(T const& t)
{
    { t.serialize() } -> std::convertible_to<std::string>;
    { t.type() } -> std::convertible_to<content_type>;
};

namespace detail {

/** Throw a validation failure naming what went wrong
*/
BOOST_DISPATCH_DECL
BOOST_NORETURN
void
throw_validation_failed(
    std::string const& what,
    source_location const& loc =
        BOOST_CURRENT_LOCATION);

} // detail

} // dispatch
} // boost

#endif
