//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_RESPONSE_HPP
#define BOOST_DISPATCH_RESPONSE_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/dispatch/fields.hpp>
#include <string>
#include <vector>

namespace boost {
namespace dispatch {

/** A response produced by the dispatcher

    The body is a sequence of chunks which the transport
    adapter writes in order.
*/
class response
{
public:
    response() = default;

    explicit
    response(unsigned status) noexcept
        : status_(status)
    {
    }

    unsigned
    status() const noexcept
    {
        return status_;
    }

    void
    set_status(unsigned code) noexcept
    {
        status_ = code;
    }

    fields&
    headers() noexcept
    {
        return headers_;
    }

    fields const&
    headers() const noexcept
    {
        return headers_;
    }

    std::vector<std::string> const&
    body() const noexcept
    {
        return body_;
    }

    void
    append_body(std::string chunk)
    {
        body_.push_back(std::move(chunk));
    }

    void
    clear_body() noexcept
    {
        body_.clear();
    }

    /** Return the body chunks joined together
    */
    BOOST_DISPATCH_DECL
    std::string
    body_string() const;

private:
    unsigned status_ = 200;
    fields headers_;
    std::vector<std::string> body_;
};

} // dispatch
} // boost

#endif
