//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/error_info.hpp>
#include <boost/dispatch/detail/write_json.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>
#include <utility>

namespace boost {
namespace dispatch {

error_info::
error_info(unsigned status)
    : status_(status)
    , what_("error_info: " + std::to_string(status))
{
}

error_info::
error_info(
    unsigned status,
    std::string body,
    content_type type)
    : status_(status)
    , body_(std::move(body))
    , type_(std::move(type))
    , what_("error_info: " + std::to_string(status))
{
}

error_info::
~error_info() = default;

char const*
error_info::
what() const noexcept
{
    return what_.c_str();
}

response
error_info::
to_response() const
{
    response res(status_);
    for(auto const& f : headers_)
        res.headers().append(f.first, f.second);
    if(! body_.empty())
    {
        if(type_)
            res.headers().set(
                "Content-Type", type_->to_string());
        res.headers().set("Content-Length",
            std::to_string(body_.size()));
        res.append_body(body_);
    }
    return res;
}

//------------------------------------------------

method_not_allowed_error::
method_not_allowed_error(
    std::vector<method> const& allowed)
    : error_info(405)
{
    std::string s;
    for(auto m : allowed)
    {
        if(! s.empty())
            s.append(", ");
        s.append(to_string(m));
    }
    add_header("Allow", s);
}

//------------------------------------------------

namespace {

json::value
to_value(std::optional<std::string> const& s)
{
    if(s)
        return json::value(*s);
    return nullptr;
}

} // (anon)

api_error_info::
api_error_info(
    unsigned status,
    params const& p)
    : error_info(status)
{
    json::object obj;
    if(p.code)
        obj["code"] = *p.code;
    else
        obj["code"] = nullptr;
    obj["developerMessage"] = to_value(p.developer_message);
    obj["userMessage"] = to_value(p.user_message);
    obj["info"] = to_value(p.info);
    set_body(detail::write_json(json::value(std::move(obj))),
        { std::string(media_types::json), "UTF-8", {} });
}

} // dispatch
} // boost
