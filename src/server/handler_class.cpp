//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/server/handler_class.hpp>

namespace boost {
namespace dispatch {

handler_class::
~handler_class() = default;

namespace detail {

void
check_callback(
    core::string_view handler,
    dispatch::method m,
    std::vector<std::type_index> const& params,
    std::vector<std::shared_ptr<argument_source const>> const& sources,
    std::size_t flexible_count)
{
    auto const fail = [&](std::string const& why)
    {
        std::string s(handler);
        s.append("::");
        s.append(to_string(m));
        s.append(": ");
        s.append(why);
        detail::throw_system_error(
            BOOST_DISPATCH_ERR(error::callback_mismatch),
            s.c_str());
    };

    if(params.size() != flexible_count + sources.size())
        fail("expected " +
            std::to_string(flexible_count + sources.size()) +
            " parameters, got " + std::to_string(params.size()));

    for(std::size_t i = 0; i < flexible_count; ++i)
        if(params[i] != std::type_index(typeid(std::string)))
            fail("parameter " + std::to_string(i) +
                " receives a path value and must be a string");

    for(std::size_t i = 0; i < sources.size(); ++i)
        if(params[flexible_count + i] != sources[i]->value_type())
            fail("parameter " + std::to_string(flexible_count + i) +
                " does not match " + sources[i]->describe());
}

void
extract_arguments(
    std::vector<std::shared_ptr<argument_source const>> const& sources,
    request& req,
    std::vector<std::any>& args)
{
    auto const base = args.size();
    args.resize(base + sources.size());
    for(auto i = sources.size(); i-- > 0;)
        args[base + i] = sources[i]->extract(req);
}

} // detail

} // dispatch
} // boost
