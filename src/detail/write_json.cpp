//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/detail/write_json.hpp>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/string.hpp>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace boost {
namespace dispatch {
namespace detail {

namespace {

void
write_escape(
    std::string& out,
    std::uint32_t u)
{
    static constexpr char hex[] = "0123456789abcdef";
    char buf[6] = {
        '\\', 'u',
        hex[(u >> 12) & 0xf],
        hex[(u >>  8) & 0xf],
        hex[(u >>  4) & 0xf],
        hex[ u        & 0xf] };
    out.append(buf, sizeof(buf));
}

// Decodes one UTF-8 sequence starting at s[i],
// returns its length or 0 if it is malformed.
std::size_t
decode_utf8(
    json::string_view s,
    std::size_t i,
    std::uint32_t& cp)
{
    unsigned char const c = s[i];
    std::size_t n;
    if((c & 0xe0) == 0xc0)
    {
        cp = c & 0x1f;
        n = 2;
    }
    else if((c & 0xf0) == 0xe0)
    {
        cp = c & 0x0f;
        n = 3;
    }
    else if((c & 0xf8) == 0xf0)
    {
        cp = c & 0x07;
        n = 4;
    }
    else
    {
        return 0;
    }
    if(s.size() - i < n)
        return 0;
    for(std::size_t k = 1; k < n; ++k)
    {
        unsigned char const cc = s[i + k];
        if((cc & 0xc0) != 0x80)
            return 0;
        cp = (cp << 6) | (cc & 0x3f);
    }
    return n;
}

void
write_string(
    std::string& out,
    json::string_view s)
{
    out.push_back('"');
    std::size_t i = 0;
    while(i < s.size())
    {
        unsigned char const c = s[i];
        if(c >= 0x80)
        {
            std::uint32_t cp;
            auto const n = decode_utf8(s, i, cp);
            if(n == 0)
            {
                write_escape(out, c);
                ++i;
                continue;
            }
            if(cp >= 0x10000)
            {
                cp -= 0x10000;
                write_escape(out, 0xd800 + (cp >> 10));
                write_escape(out, 0xdc00 + (cp & 0x3ff));
            }
            else
            {
                write_escape(out, cp);
            }
            i += n;
            continue;
        }
        switch(c)
        {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        default:
            if(c < 0x20 || c == 0x7f)
                write_escape(out, c);
            else
                out.push_back(static_cast<char>(c));
            break;
        }
        ++i;
    }
    out.push_back('"');
}

void
write_double(
    std::string& out,
    double d)
{
    if(std::isnan(d))
    {
        out += "NaN";
        return;
    }
    if(std::isinf(d))
    {
        out += d < 0 ? "-Infinity" : "Infinity";
        return;
    }

    // shortest round-trip digits as "[-]d[.ddd]e(+|-)XX"
    char buf[40];
    auto const r = std::to_chars(
        buf, buf + sizeof(buf) - 1, d,
        std::chars_format::scientific);
    *r.ptr = '\0';
    char const* p = buf;
    if(*p == '-')
    {
        out.push_back('-');
        ++p;
    }
    std::string digits;
    for(; *p != 'e'; ++p)
        if(*p != '.')
            digits.push_back(*p);
    int const exp = std::atoi(p + 1);
    int const n = static_cast<int>(digits.size());

    if(exp >= -4 && exp < 16)
    {
        if(exp < 0)
        {
            out += "0.";
            out.append(-exp - 1, '0');
            out += digits;
        }
        else if(exp + 1 >= n)
        {
            out += digits;
            out.append(exp + 1 - n, '0');
            out += ".0";
        }
        else
        {
            out.append(digits, 0, exp + 1);
            out.push_back('.');
            out.append(digits, exp + 1);
        }
        return;
    }

    out.push_back(digits[0]);
    if(n > 1)
    {
        out.push_back('.');
        out.append(digits, 1);
    }
    out.push_back('e');
    out.push_back(exp < 0 ? '-' : '+');
    int const a = exp < 0 ? -exp : exp;
    if(a < 10)
        out.push_back('0');
    out += std::to_string(a);
}

void
write_value(
    std::string& out,
    json::value const& jv)
{
    switch(jv.kind())
    {
    case json::kind::null:
        out += "null";
        break;

    case json::kind::bool_:
        out += jv.get_bool() ? "true" : "false";
        break;

    case json::kind::int64:
        out += std::to_string(jv.get_int64());
        break;

    case json::kind::uint64:
        out += std::to_string(jv.get_uint64());
        break;

    case json::kind::double_:
        write_double(out, jv.get_double());
        break;

    case json::kind::string:
        write_string(out, jv.get_string());
        break;

    case json::kind::array:
    {
        out.push_back('[');
        bool first = true;
        for(auto const& e : jv.get_array())
        {
            if(! first)
                out += ", ";
            first = false;
            write_value(out, e);
        }
        out.push_back(']');
        break;
    }

    case json::kind::object:
    {
        out.push_back('{');
        bool first = true;
        for(auto const& kv : jv.get_object())
        {
            if(! first)
                out += ", ";
            first = false;
            write_string(out, kv.key());
            out += ": ";
            write_value(out, kv.value());
        }
        out.push_back('}');
        break;
    }
    }
}

} // (anon)

std::string
write_json(json::value const& jv)
{
    std::string out;
    write_value(out, jv);
    return out;
}

} // detail
} // dispatch
} // boost
