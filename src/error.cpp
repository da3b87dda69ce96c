//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/error.hpp>
#include <boost/assert.hpp>
#include <cstring>

namespace boost {
namespace dispatch {

namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "boost.dispatch";
}

std::string
error_cat_type::
message(int code) const
{
    return message(code, nullptr, 0);
}

char const*
error_cat_type::
message(
    int code,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(code))
    {
    case error::not_found: return "route not found";
    case error::method_not_allowed: return "method not allowed";
    case error::validation_failed: return "validation failed";
    case error::duplicate_route: return "duplicate route";
    case error::parcel_mismatch: return "parcel mismatch";
    case error::callback_mismatch: return "callback mismatch";
    case error::double_response: return "double response";
    case error::no_response: return "no response";
    case error::body_too_large: return "body too large";
    default:
        return "unknown";
    }
}

//-----------------------------------------------

const char*
condition_cat_type::
name() const noexcept
{
    return "boost.dispatch";
}

std::string
condition_cat_type::
message(int code) const
{
    return message(code, nullptr, 0);
}

char const*
condition_cat_type::
message(
    int code,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<condition>(code))
    {
    case condition::configuration_error: return "configuration error";
    case condition::protocol_violation: return "protocol violation";
    default:
        return "unknown";
    }
}

bool
condition_cat_type::
equivalent(
    system::error_code const& ec,
    int code) const noexcept
{
    switch(static_cast<condition>(code))
    {
    case condition::configuration_error:
        return
            ec == error::duplicate_route ||
            ec == error::parcel_mismatch ||
            ec == error::callback_mismatch;

    case condition::protocol_violation:
        return
            ec == error::double_response ||
            ec == error::no_response;

    default:
        return false;
    }
}

//-----------------------------------------------

// msvc 14.0 has a bug that warns about inability
// to use constexpr construction here, even though
// there's no constexpr construction
#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( push )
# pragma warning( disable : 4592 )
#endif

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
constinit condition_cat_type condition_cat;
#else
error_cat_type error_cat;
condition_cat_type condition_cat;
#endif

#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( pop )
#endif

} // detail

} // dispatch
} // boost
