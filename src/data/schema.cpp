//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/data/schema.hpp>
#include <boost/dispatch/data/structured_data.hpp>
#include <boost/dispatch/detail/except.hpp>
#include <boost/json/array.hpp>
#include <algorithm>

namespace boost {
namespace dispatch {

namespace {

char const*
kind_name(field_type::kind k) noexcept
{
    switch(k)
    {
    case field_type::kind::string:  return "a string";
    case field_type::kind::integer: return "an integer";
    case field_type::kind::number:  return "a number";
    case field_type::kind::boolean: return "a boolean";
    case field_type::kind::object:  return "an object";
    case field_type::kind::null:    return "null";
    case field_type::kind::list:    return "a list";
    case field_type::kind::nested:  return "an object";
    default:
        return "?";
    }
}

BOOST_NORETURN
void
fail_type(
    std::string const& path,
    field_type::kind k)
{
    detail::throw_validation_failed(
        "field '" + path + "' must be " + kind_name(k));
}

} // (anon)

field_type
field_type::
list_of(field_type element)
{
    field_type t(kind::list);
    t.elem_ = std::make_shared<
        field_type const>(std::move(element));
    return t;
}

field_type
field_type::
nested(schema s)
{
    field_type t(kind::nested);
    t.nested_ = std::make_shared<
        schema const>(std::move(s));
    return t;
}

//------------------------------------------------

schema&
schema::
required(
    std::string name,
    field_type t)
{
    for(auto const& f : fields_)
        if(f.name == name)
            detail::throw_invalid_argument(
                "duplicate schema field");
    fields_.push_back({
        std::move(name), std::move(t), false, nullptr });
    return *this;
}

schema&
schema::
optional(
    std::string name,
    field_type t,
    json::value def)
{
    for(auto const& f : fields_)
        if(f.name == name)
            detail::throw_invalid_argument(
                "duplicate schema field");
    fields_.push_back({
        std::move(name), std::move(t), true, std::move(def) });
    return *this;
}

json::object
schema::
validate(json::value const& v) const
{
    return validate(v, std::string());
}

json::object
schema::
validate(
    json::value const& v,
    std::string const& path) const
{
    if(! v.is_object())
    {
        if(path.empty())
            detail::throw_validation_failed(
                "payload must be an object");
        fail_type(path, field_type::kind::nested);
    }
    auto const& obj = v.get_object();

    if(policy_ == extra_fields::reject)
    {
        for(auto const& kv : obj)
        {
            auto it = std::find_if(
                fields_.begin(), fields_.end(),
                [&](schema_field const& f)
                {
                    return f.name == kv.key();
                });
            if(it == fields_.end())
                detail::throw_validation_failed(
                    "unexpected field '" +
                    (path.empty() ? std::string() : path + ".") +
                    std::string(kv.key()) + "'");
        }
    }

    json::object out;
    for(auto const& f : fields_)
    {
        auto const fpath = path.empty() ?
            f.name : path + "." + f.name;
        auto const* p = obj.if_contains(f.name);
        if(! p)
        {
            if(! f.optional)
                detail::throw_validation_failed(
                    "missing field '" + fpath + "'");
            out[f.name] = f.default_value;
            continue;
        }
        if(f.optional && p->is_null())
        {
            out[f.name] = nullptr;
            continue;
        }
        out[f.name] = check(*p, f.type, fpath);
    }
    return out;
}

json::value
schema::
check(
    json::value const& v,
    field_type const& t,
    std::string const& path)
{
    using kind = field_type::kind;
    switch(t.get_kind())
    {
    case kind::string:
        if(! v.is_string())
            fail_type(path, kind::string);
        return v;

    case kind::integer:
        if(! v.is_int64() && ! v.is_uint64())
            fail_type(path, kind::integer);
        return v;

    case kind::number:
        if(! v.is_number())
            fail_type(path, kind::number);
        return v;

    case kind::boolean:
        if(! v.is_bool())
            fail_type(path, kind::boolean);
        return v;

    case kind::object:
        if(! v.is_object())
            fail_type(path, kind::object);
        return v;

    case kind::null:
        if(! v.is_null())
            fail_type(path, kind::null);
        return v;

    case kind::list:
    {
        if(! v.is_array())
            fail_type(path, kind::list);
        json::array out;
        auto const& arr = v.get_array();
        out.reserve(arr.size());
        for(std::size_t i = 0; i < arr.size(); ++i)
            out.push_back(check(arr[i], t.element(),
                path + "[" + std::to_string(i) + "]"));
        return out;
    }

    case kind::nested:
        return t.nested_schema().validate(v, path);
    }
    detail::throw_logic_error();
}

} // dispatch
} // boost
