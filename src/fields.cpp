//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/fields.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <algorithm>

namespace boost {
namespace dispatch {

namespace {

inline
char
fold(char c) noexcept
{
    if(c == '_')
        return '-';
    return grammar::to_lower(c);
}

} // (anon)

bool
field_name_equal(
    core::string_view s0,
    core::string_view s1) noexcept
{
    auto n = s0.size();
    if(s1.size() != n)
        return false;
    auto p1 = s0.data();
    auto p2 = s1.data();
    char a, b;
    // fast loop
    while(n--)
    {
        a = *p1++;
        b = *p2++;
        if(a != b)
            goto slow;
    }
    return true;
    do
    {
        a = *p1++;
        b = *p2++;
    slow:
        if(fold(a) != fold(b))
            return false;
    }
    while(n--);
    return true;
}

//------------------------------------------------

void
fields::
append(
    core::string_view name,
    core::string_view value)
{
    v_.emplace_back(
        std::string(name),
        std::string(value));
}

void
fields::
set(
    core::string_view name,
    core::string_view value)
{
    auto it = std::find_if(v_.begin(), v_.end(),
        [&](value_type const& f)
        {
            return field_name_equal(f.first, name);
        });
    if(it == v_.end())
    {
        append(name, value);
        return;
    }
    it->second.assign(value.data(), value.size());
    v_.erase(std::remove_if(std::next(it), v_.end(),
        [&](value_type const& f)
        {
            return field_name_equal(f.first, name);
        }), v_.end());
}

std::size_t
fields::
erase(core::string_view name) noexcept
{
    auto const n = v_.size();
    v_.erase(std::remove_if(v_.begin(), v_.end(),
        [&](value_type const& f)
        {
            return field_name_equal(f.first, name);
        }), v_.end());
    return n - v_.size();
}

bool
fields::
exists(core::string_view name) const noexcept
{
    return count(name) != 0;
}

std::size_t
fields::
count(core::string_view name) const noexcept
{
    std::size_t n = 0;
    for(auto const& f : v_)
        if(field_name_equal(f.first, name))
            ++n;
    return n;
}

core::string_view
fields::
value_or(
    core::string_view name,
    core::string_view def) const noexcept
{
    for(auto const& f : v_)
        if(field_name_equal(f.first, name))
            return f.second;
    return def;
}

std::vector<std::string>
fields::
find_all(core::string_view name) const
{
    std::vector<std::string> r;
    for(auto const& f : v_)
        if(field_name_equal(f.first, name))
            r.push_back(f.second);
    return r;
}

} // dispatch
} // boost
