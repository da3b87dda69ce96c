//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/rfc/content_type.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <boost/url/grammar/error.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <boost/url/grammar/parse.hpp>
#include <boost/url/grammar/token_rule.hpp>
#include <boost/assert.hpp>
#include <new>

namespace boost {
namespace dispatch {

namespace detail {

// tchar from rfc9110
BOOST_INLINE_CONSTEXPR grammar::lut_chars tchars =
    "!#$%&'*+-.^_`|~"
    "0123456789"
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz";

inline
void
skip_ows(
    char const*& it,
    char const* end) noexcept
{
    while( it != end &&
        (*it == ' ' || *it == '\t'))
        ++it;
}

inline
void
append_lower(
    std::string& dest,
    core::string_view s)
{
    for(char c : s)
        dest.push_back(grammar::to_lower(c));
}

// quoted-string = DQUOTE *( qdtext / quoted-pair ) DQUOTE
system::result<std::string>
parse_quoted(
    char const*& it,
    char const* end)
{
    BOOST_ASSERT(it != end && *it == '"');
    ++it;
    std::string s;
    while(it != end)
    {
        char c = *it++;
        if(c == '"')
            return s;
        if(c == '\\')
        {
            if(it == end)
                break;
            c = *it++;
        }
        s.push_back(c);
    }
    BOOST_DISPATCH_RETURN_EC(
        grammar::error::need_more);
}

} // detail

std::string
content_type::
to_string() const
{
    std::string s = media_type;
    if(charset)
    {
        s.append("; charset=");
        s.append(*charset);
    }
    if(boundary)
    {
        s.append("; boundary=");
        s.append(*boundary);
    }
    return s;
}

namespace implementation_defined {

auto
content_type_rule_t::
parse(
    char const*& it,
    char const* end) const noexcept ->
        system::result<value_type>
{
    constexpr auto token =
        grammar::token_rule(detail::tchars);

    auto type = grammar::parse(it, end, token);
    if(! type)
        return type.error();
    if(it == end || *it != '/')
        BOOST_DISPATCH_RETURN_EC(
            grammar::error::mismatch);
    ++it;
    auto subtype = grammar::parse(it, end, token);
    if(! subtype)
        return subtype.error();

    try
    {
        content_type ct;
        detail::append_lower(ct.media_type, *type);
        ct.media_type.push_back('/');
        detail::append_lower(ct.media_type, *subtype);

        for(;;)
        {
            auto const it0 = it;
            detail::skip_ows(it, end);
            if(it == end || *it != ';')
            {
                // trailing whitespace is not ours
                it = it0;
                break;
            }
            ++it;
            detail::skip_ows(it, end);

            auto name = grammar::parse(it, end, token);
            if(! name)
                return name.error();
            if(it == end)
                BOOST_DISPATCH_RETURN_EC(
                    grammar::error::need_more);
            if(*it++ != '=')
                BOOST_DISPATCH_RETURN_EC(
                    grammar::error::mismatch);

            std::string value;
            if(it != end && *it == '"')
            {
                auto rv = detail::parse_quoted(it, end);
                if(! rv)
                    return rv.error();
                value = std::move(*rv);
            }
            else
            {
                auto rv = grammar::parse(it, end, token);
                if(! rv)
                    return rv.error();
                value = *rv;
            }

            if(grammar::ci_is_equal(*name, "charset"))
            {
                ct.charset.emplace();
                detail::append_lower(*ct.charset, value);
            }
            else if(grammar::ci_is_equal(*name, "boundary"))
            {
                ct.boundary = std::move(value);
            }
        }
        return ct;
    }
    catch(std::bad_alloc const&)
    {
        BOOST_DISPATCH_RETURN_EC(
            system::errc::not_enough_memory);
    }
}

} // implementation_defined

system::result<content_type>
parse_content_type(core::string_view s)
{
    // surrounding whitespace is not part of the field value
    auto it = s.data();
    auto end = it + s.size();
    detail::skip_ows(it, end);
    while( end != it &&
        (end[-1] == ' ' || end[-1] == '\t'))
        --end;
    return grammar::parse(
        core::string_view(it, end - it),
        content_type_rule);
}

} // dispatch
} // boost
