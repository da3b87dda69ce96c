//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/server/dispatcher.hpp>
#include <boost/dispatch/server/endpoint.hpp>
#include <boost/dispatch/server/handler_class.hpp>
#include <boost/dispatch/server/statuses.hpp>
#include <boost/dispatch/error.hpp>
#include <boost/dispatch/error_info.hpp>
#include <boost/system/system_error.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>
#include <string_view>

namespace boost {
namespace dispatch {

dispatcher::
dispatcher(router const& r)
    : dispatcher(r, make_dispatcher_config())
{
}

dispatcher::
dispatcher(
    router const& r,
    std::shared_ptr<dispatcher_config const> cfg)
    : r_(r)
    , cfg_(std::move(cfg))
{
    if(! cfg_)
        cfg_ = make_dispatcher_config();
}

response
dispatcher::
handle(request& req) const
{
    req.set_body_limit(cfg_->body_limit);

    auto res = invoke(req);

    if(statuses::is_empty(res.status()))
    {
        res.clear_body();
        res.headers().erase("Content-Length");
    }
    else if(req.method() == method::head)
    {
        res.clear_body();
    }

    if(statuses::is_error(res.status()))
        cfg_->log->debug("{} /{} -> {}",
            std::string_view(req.method_string()),
            fmt::join(req.segments(), "/"),
            res.status());
    return res;
}

response
dispatcher::
invoke(request& req) const
{
    auto& log = *cfg_->log;
    std::string_view const verb_s = req.method_string();

    auto rv = r_.resolve(req.segments());
    if(! rv)
    {
        log.debug("{} /{}: no route",
            verb_s,
            fmt::join(req.segments(), "/"));
        return cfg_->not_found.to_response();
    }

    auto const& m = *rv;
    try
    {
        auto ep = m.handler->create();
        detail::endpoint_access::attach(*ep, req);
        m.handler->setup(*ep, *m.parcel);

        auto const verb = req.method();
        if( verb == method::unknown ||
            ! m.handler->implements(verb))
        {
            log.debug("{} {}: method not allowed",
                verb_s, m.route->to_string());
            return method_not_allowed_error(
                m.handler->methods()).to_response();
        }

        m.handler->invoke(verb, *ep, m.values);
        if(! ep->responded())
            detail::throw_system_error(
                BOOST_DISPATCH_ERR(error::no_response));
        return std::move(
            detail::endpoint_access::get_response(*ep));
    }
    catch(error_info const& e)
    {
        log.debug("{} {}: {}",
            verb_s, m.route->to_string(), e.what());
        return e.to_response();
    }
    catch(system::system_error const& e)
    {
        if(e.code() == error::body_too_large)
        {
            log.debug("{} {}: {}",
                verb_s, m.route->to_string(), e.what());
            return payload_too_large_error().to_response();
        }
        log.error("{} {} in {}: {}",
            verb_s, m.route->to_string(),
            m.handler->name(), e.what());
        return response(500);
    }
    catch(std::exception const& e)
    {
        log.error("{} {} in {}: unhandled exception: {}",
            verb_s, m.route->to_string(),
            m.handler->name(), e.what());
        return response(500);
    }
    catch(...)
    {
        log.error("{} {} in {}: unknown exception",
            verb_s, m.route->to_string(),
            m.handler->name());
        return response(500);
    }
}

} // dispatch
} // boost
