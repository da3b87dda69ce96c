//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/request.hpp>
#include <boost/dispatch/error.hpp>
#include <boost/dispatch/detail/except.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url_view.hpp>

namespace boost {
namespace dispatch {

system::result<request>
request::
from_target(
    core::string_view method,
    core::string_view target)
{
    auto rv = urls::parse_origin_form(target);
    if(! rv)
        return rv.error();

    request req;
    req.set_method(method);
    for(auto const& s : rv->segments())
        req.segments_.push_back(s);
    for(auto const& p : rv->params())
        req.query_.emplace_back(p.key, p.value);
    return req;
}

method
request::
method() const noexcept
{
    return string_to_method(method_);
}

std::vector<std::string>
request::
query_values(core::string_view name) const
{
    std::vector<std::string> r;
    for(auto const& p : query_)
        if(p.first == name)
            r.push_back(p.second);
    return r;
}

void
request::
set_body(std::string body)
{
    reader_ = nullptr;
    content_length_ = body.size();
    body_ = std::move(body);
    body_read_ = true;
}

void
request::
set_body_reader(
    body_reader reader,
    std::optional<std::size_t> content_length)
{
    reader_ = std::move(reader);
    content_length_ = content_length;
    body_.clear();
    body_read_ = false;
}

std::string const&
request::
body()
{
    if(body_read_)
    {
        if(body_.size() > body_limit_)
            detail::throw_system_error(
                BOOST_DISPATCH_ERR(error::body_too_large));
        return body_;
    }

    if( content_length_ &&
        *content_length_ > body_limit_)
        detail::throw_system_error(
            BOOST_DISPATCH_ERR(error::body_too_large));

    char buf[4096];
    for(;;)
    {
        auto const n = reader_(buf, sizeof(buf));
        if(n == 0)
            break;
        if(body_.size() + n > body_limit_)
            detail::throw_system_error(
                BOOST_DISPATCH_ERR(error::body_too_large));
        body_.append(buf, n);
    }
    body_read_ = true;
    reader_ = nullptr;
    return body_;
}

std::optional<content_type>
get_content_type(request const& req)
{
    auto const s = req.headers().value_or("Content-Type");
    if(s.empty())
        return std::nullopt;
    auto rv = parse_content_type(s);
    if(! rv)
        return std::nullopt;
    return std::move(*rv);
}

} // dispatch
} // boost
