//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/server/route.hpp>
#include <boost/dispatch/detail/except.hpp>
#include <boost/url/grammar/digit_chars.hpp>

namespace boost {
namespace dispatch {

segment
segment::
digits(std::size_t n)
{
    if(n == 0)
        detail::throw_invalid_argument(
            "segment::digits requires n > 0");
    return segment(constraint::digits, n);
}

segment
segment::
string(std::size_t max)
{
    if(max == 0)
        detail::throw_invalid_argument(
            "segment::string requires max > 0");
    return segment(constraint::bounded, max);
}

bool
segment::
matches(core::string_view token) const noexcept
{
    if(token.empty())
        return false;
    switch(c_)
    {
    case constraint::any:
        return true;

    case constraint::digits:
        if(token.size() != n_)
            return false;
        for(char c : token)
            if(! grammar::digit_chars(c))
                return false;
        return true;

    case constraint::bounded:
        return token.size() <= n_;

    default:
        return false;
    }
}

std::string
segment::
to_string() const
{
    switch(c_)
    {
    case constraint::any:
        return "{any}";
    case constraint::digits:
        return "{digits:" + std::to_string(n_) + "}";
    case constraint::bounded:
        return "{string:" + std::to_string(n_) + "}";
    default:
        return lit_;
    }
}

//------------------------------------------------

std::size_t
route::
flexible_count() const noexcept
{
    std::size_t n = 0;
    for(auto const& s : v_)
        if(s.is_flexible())
            ++n;
    return n;
}

route
route::
with_prefix(segment s) const
{
    std::vector<segment> v;
    v.reserve(v_.size() + 1);
    v.push_back(std::move(s));
    v.insert(v.end(), v_.begin(), v_.end());
    return route(std::move(v));
}

std::string
route::
to_string() const
{
    if(v_.empty())
        return "/";
    std::string s;
    for(auto const& seg : v_)
    {
        s.push_back('/');
        s.append(seg.to_string());
    }
    return s;
}

} // dispatch
} // boost
