//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/data/form_data.hpp>
#include <boost/dispatch/detail/except.hpp>
#include <boost/url/encode.hpp>
#include <boost/url/encoding_opts.hpp>
#include <boost/url/parse_query.hpp>
#include <boost/url/rfc/unreserved_chars.hpp>
#include <boost/throw_exception.hpp>
#include <map>
#include <stdexcept>

namespace boost {
namespace dispatch {

form_data::
form_data(
    core::string_view raw,
    std::optional<content_type> const& ct,
    std::vector<std::string> const& names)
{
    if(! ct)
        detail::throw_validation_failed(
            "Content-Type is required");
    if(ct->media_type != media_types::form_urlencoded)
        detail::throw_validation_failed(
            "media type must be application/x-www-form-urlencoded, but was " +
            ct->media_type);
    if(ct->charset && *ct->charset != "utf-8")
        detail::throw_validation_failed(
            "unsupported charset " + *ct->charset);

    auto rv = urls::parse_query(raw);
    if(! rv)
        detail::throw_validation_failed(
            "payload is not url-encoded: " +
            rv.error().message());

    urls::encoding_opts opt;
    opt.space_as_plus = true;

    std::map<std::string, std::string> parsed;
    for(auto const p : *rv)
    {
        if(p.key.empty() && ! p.has_value)
            continue;
        auto key = p.key.decode(opt);
        if(parsed.count(key))
            detail::throw_validation_failed(
                "duplicated field '" + key + "'");
        parsed.emplace(std::move(key),
            p.value.decode(opt));
    }

    v_.reserve(names.size());
    for(auto const& name : names)
    {
        auto it = parsed.find(name);
        if(it == parsed.end())
            detail::throw_validation_failed(
                "missing field '" + name + "'");
        v_.emplace_back(name, std::move(it->second));
    }
}

std::string const&
form_data::
at(core::string_view name) const
{
    for(auto const& kv : v_)
        if(kv.first == name)
            return kv.second;
    throw_exception(std::out_of_range(
        "form_data::at"));
}

std::string
form_data::
serialize() const
{
    urls::encoding_opts opt;
    opt.space_as_plus = true;

    std::string s;
    for(auto const& kv : v_)
    {
        if(! s.empty())
            s.push_back('&');
        s.append(urls::encode(
            kv.first, urls::unreserved_chars, opt));
        s.push_back('=');
        s.append(urls::encode(
            kv.second, urls::unreserved_chars, opt));
    }
    return s;
}

content_type
form_data::
type() const
{
    return { std::string(media_types::form_urlencoded), "UTF-8", {} };
}

} // dispatch
} // boost
