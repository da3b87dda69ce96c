//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_TEST_HANDLERS_HPP
#define BOOST_DISPATCH_TEST_HANDLERS_HPP

#include <boost/dispatch/data/json_data.hpp>
#include <boost/dispatch/server/argument_source.hpp>
#include <boost/dispatch/server/endpoint.hpp>
#include <boost/dispatch/server/handler_class.hpp>
#include <boost/json/value_to.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace boost {
namespace dispatch {
namespace test {

struct upsidedown_request : json_data
{
    std::string token;

    static
    schema const&
    get_schema()
    {
        static schema const s = schema()
            .required("token", field_type::string());
        return s;
    }

    upsidedown_request(
        core::string_view raw,
        std::optional<content_type> const& ct)
        : json_data(raw, ct, get_schema())
        , token(json::value_to<std::string>(
            value().at("token")))
    {
    }
};

struct upsidedown_response : json_data
{
    static
    schema const&
    get_schema()
    {
        static schema const s = schema()
            .required("result", field_type::string());
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

// reverses the token it receives
struct upsidedown : endpoint
{
    static
    void
    methods(method_table<upsidedown>& t)
    {
        t.on(method::get, &upsidedown::do_get)
            .wrap(body_of<upsidedown_request>())
            .produces<upsidedown_response>();
    }

    void
    do_get(upsidedown_request const& in)
    {
        std::string s(in.token.rbegin(), in.token.rend());
        send_api(upsidedown_response(s));
    }
};

//------------------------------------------------

// echoes what it was given so tests can see the argument order
struct echo : endpoint
{
    static
    void
    methods(method_table<echo>& t)
    {
        t.on(method::get, &echo::do_get);
        t.on(method::post, &echo::do_post);
        t.on(method::delete_, &echo::do_delete);
        t.on(method::head, &echo::do_get);
    }

    void
    do_get()
    {
        send_body("get");
    }

    void
    do_post()
    {
        send_only_status(201);
    }

    void
    do_delete()
    {
        send_only_status(204);
    }
};

// receives two wrapped query parameters
struct ordering : endpoint
{
    static int invoked;

    static
    void
    methods(method_table<ordering>& t)
    {
        t.on(method::get, &ordering::do_get)
            .wrap(query_of("after").required(error_info(400, "after")))
            .wrap(query_of("before").required(error_info(400, "before")));
    }

    void
    do_get(
        std::string const& after,
        std::string const& before)
    {
        ++invoked;
        send_body(after + "," + before);
    }
};

inline int ordering::invoked = 0;

// fails with 401 unless a token is present
struct guarded : endpoint
{
    static int invoked;

    static
    void
    methods(method_table<guarded>& t)
    {
        t.on(method::get, &guarded::do_get)
            .wrap(header_of("X-Token").required(error_info(401)));
    }

    void
    do_get(std::string const&)
    {
        ++invoked;
        send_only_status(200);
    }
};

inline int guarded::invoked = 0;

// captured path values plus a mapped query parameter
struct user_posts : endpoint
{
    static
    void
    methods(method_table<user_posts>& t)
    {
        t.on(method::get, &user_posts::do_get)
            .wrap(query_of("page")
                .unique(error_info(400, "page"))
                .map([](std::string const& s)
                {
                    return std::stoi(s);
                }));
    }

    void
    do_get(
        std::string const& user,
        std::string const& post,
        std::optional<int> page)
    {
        json::object obj;
        obj["user"] = user;
        obj["post"] = post;
        if(page)
            obj["page"] = *page;
        else
            obj["page"] = nullptr;
        send_json(obj);
    }
};

// answers using its parcel
struct greeter : endpoint
{
    std::string greeting;
    int times = 0;

    void
    setup(std::string const& g, int n)
    {
        greeting = g;
        times = n;
    }

    static
    void
    methods(method_table<greeter>& t)
    {
        t.on(method::get, &greeter::do_get);
    }

    void
    do_get()
    {
        std::string s;
        for(int i = 0; i < times; ++i)
            s += greeting;
        send_body(s);
    }
};

// breaks the response protocol in several ways
struct misbehaving : endpoint
{
    static
    void
    methods(method_table<misbehaving>& t)
    {
        t.on(method::get, &misbehaving::do_get);
        t.on(method::post, &misbehaving::do_post);
        t.on(method::put, &misbehaving::do_put);
        t.on(method::patch, &misbehaving::do_patch);
    }

    // responds twice
    void
    do_get()
    {
        send_only_status(200);
        send_only_status(200);
    }

    // never responds
    void
    do_post()
    {
    }

    void
    do_put()
    {
        throw std::runtime_error("secret detail");
    }

    void
    do_patch()
    {
        send_err(error_info(409, "conflict"));
    }
};

} // test
} // dispatch
} // boost

#endif
