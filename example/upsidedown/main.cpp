//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value_to.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <string>

namespace dispatch = boost::dispatch;
namespace json = boost::json;

struct upsidedown_request : dispatch::json_data
{
    std::string token;

    static
    dispatch::schema const&
    get_schema()
    {
        static dispatch::schema const s = dispatch::schema()
            .required("token", dispatch::field_type::string());
        return s;
    }

    upsidedown_request(
        boost::core::string_view raw,
        std::optional<dispatch::content_type> const& ct)
        : json_data(raw, ct, get_schema())
        , token(json::value_to<std::string>(
            value().at("token")))
    {
    }
};

struct upsidedown_response : dispatch::json_data
{
    static
    dispatch::schema const&
    get_schema()
    {
        static dispatch::schema const s = dispatch::schema()
            .required("result", dispatch::field_type::string());
        return s;
    }

    explicit
    upsidedown_response(std::string const& result)
        : json_data(
            json::object{{ "result", result }},
            get_schema())
    {
    }
};

struct upsidedown : dispatch::endpoint
{
    static
    void
    methods(dispatch::method_table<upsidedown>& t)
    {
        t.on(dispatch::method::get, &upsidedown::do_get)
            .wrap(dispatch::body_of<upsidedown_request>())
            .produces<upsidedown_response>();
    }

    void
    do_get(upsidedown_request const& in)
    {
        std::string s(in.token.rbegin(), in.token.rend());
        send_api(upsidedown_response(s));
    }
};

static
void
print(dispatch::response const& res)
{
    std::cout << res.status() << "\n";
    for(auto const& f : res.headers())
        std::cout << f.first << ": " << f.second << "\n";
    std::cout << "\n" << res.body_string() << "\n\n";
}

int
main(int argc, char** argv)
{
    std::string token = argc > 1 ? argv[1] : "abcdefg";

    spdlog::set_level(spdlog::level::debug);

    dispatch::router r;
    r.add(dispatch::route{ "upsidedown" },
        dispatch::handler_class::of<upsidedown>(),
        {}, { 1 });

    dispatch::dispatcher d(r);

    auto rv = dispatch::request::from_target("GET", "/v1/upsidedown");
    if(! rv)
    {
        std::cerr << rv.error().message() << "\n";
        return EXIT_FAILURE;
    }

    json::object body;
    body["token"] = token;
    rv->headers().append("Content-Type", "application/json");
    rv->set_body(json::serialize(body));
    print(d.handle(*rv));

    // no body at all
    auto rv2 = dispatch::request::from_target("GET", "/v1/upsidedown");
    if(rv2)
        print(d.handle(*rv2));

    return EXIT_SUCCESS;
}
