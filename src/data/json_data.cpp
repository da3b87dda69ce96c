//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/data/json_data.hpp>
#include <boost/dispatch/detail/write_json.hpp>
#include <boost/json/parse.hpp>

namespace boost {
namespace dispatch {

namespace {

json::object
parse_payload(
    core::string_view raw,
    std::optional<content_type> const& ct,
    schema const& s)
{
    if(! ct)
        detail::throw_validation_failed(
            "Content-Type is required");
    if(ct->media_type != media_types::json)
        detail::throw_validation_failed(
            "media type must be application/json, but was " +
            ct->media_type);
    if(ct->charset && *ct->charset != "utf-8")
        detail::throw_validation_failed(
            "unsupported charset " + *ct->charset);

    system::error_code ec;
    auto jv = json::parse(raw, ec);
    if(ec.failed())
        detail::throw_validation_failed(
            "payload is not valid JSON: " + ec.message());
    return s.validate(jv);
}

} // (anon)

json_data::
json_data(
    core::string_view raw,
    std::optional<content_type> const& ct,
    schema const& s)
    : obj_(parse_payload(raw, ct, s))
{
}

json_data::
json_data(
    json::object const& obj,
    schema const& s)
    : obj_(s.validate(obj))
{
}

std::string
json_data::
serialize() const
{
    return detail::write_json(json::value(obj_));
}

content_type
json_data::
type() const
{
    return { std::string(media_types::json), "UTF-8", {} };
}

} // dispatch
} // boost
