//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_DATA_BINARY_DATA_HPP
#define BOOST_DISPATCH_DATA_BINARY_DATA_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/dispatch/data/structured_data.hpp>
#include <optional>
#include <string>

namespace boost {
namespace dispatch {

/** Structured data accepting any bytes

    The Content-Type is ignored. The bytes are exposed
    unchanged.
*/
class binary_data
{
public:
    binary_data(
        core::string_view raw,
        std::optional<content_type> const& = {})
        : raw_(raw)
    {
    }

    std::string const&
    raw() const noexcept
    {
        return raw_;
    }

    std::string
    serialize() const
    {
        return raw_;
    }

    content_type
    type() const
    {
        return { std::string(media_types::octet_stream), {}, {} };
    }

private:
    std::string raw_;
};

} // dispatch
} // boost

#endif
