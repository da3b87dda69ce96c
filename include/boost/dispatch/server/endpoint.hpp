//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_SERVER_ENDPOINT_HPP
#define BOOST_DISPATCH_SERVER_ENDPOINT_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/dispatch/data/structured_data.hpp>
#include <boost/dispatch/error_info.hpp>
#include <boost/dispatch/request.hpp>
#include <boost/dispatch/response.hpp>
#include <boost/dispatch/rfc/content_type.hpp>
#include <boost/json/value.hpp>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace boost {
namespace dispatch {

namespace detail {
class endpoint_access;
} // detail

/** Base class for request handlers

    A handler type derives from this class, declares its
    callbacks in a static `methods` function, and optionally
    declares a `setup` member receiving its parcel. One
    object is created per request.

    A callback answers by calling exactly one of the
    `send_*` functions. Headers added beforehand with
    @ref add_header are kept.

    @par Example
    @code
    struct hello : endpoint
    {
        static void methods(method_table<hello>& t)
        {
            t.on(method::get, &hello::do_get);
        }

        void do_get()
        {
            send_body("Hello, world!");
        }
    };
    @endcode

    @see
        @ref handler_class,
        @ref method_table.
*/
class BOOST_DISPATCH_DECL
    endpoint
{
public:
    virtual ~endpoint();

    endpoint() = default;
    endpoint(endpoint const&) = delete;
    endpoint& operator=(endpoint const&) = delete;

    /** Return the request being handled
    */
    dispatch::request&
    request() const noexcept
    {
        return *req_;
    }

    /** Return the request's parsed Content-Type, if any
    */
    std::optional<content_type>
    request_content_type() const;

    /** Return true if a response was emitted
    */
    bool
    responded() const noexcept
    {
        return responded_;
    }

    /** Add a response header

        Parameters are appended as `; name=value`.

        @par Example
        @code
        add_header("Content-Disposition", "attachment",
            {{"filename", "report.csv"}});
        @endcode
    */
    void
    add_header(
        core::string_view name,
        core::string_view value,
        std::initializer_list<std::pair<
            core::string_view, core::string_view>> params = {});

    /** Set the Content-Type response header
    */
    void
    add_content_type(content_type const& ct);

    /** Respond with a status and no body

        @throw system::system_error with
        @ref error::double_response if a response
        was already emitted.
    */
    void
    send_only_status(unsigned status = 200);

    /** Respond with a body

        When `ct` is not empty it becomes the Content-Type.
        Content-Length is set to the body size.

        @throw system::system_error with
        @ref error::double_response if a response
        was already emitted.
    */
    void
    send_body(
        std::string body,
        std::optional<content_type> ct = plain_text(),
        unsigned status = 200);

    /** Respond with a body made of several chunks

        @throw system::system_error with
        @ref error::double_response if a response
        was already emitted.
    */
    void
    send_chunks(
        std::vector<std::string> chunks,
        std::optional<content_type> ct = plain_text(),
        unsigned status = 200);

    /** Respond with the contents of a file

        The file is read in chunks which become the
        body, and Content-Length is the file size.
        When `fname` is set a
        `Content-Disposition: attachment; filename=<fname>`
        header is added.

        @throw system::system_error if `path` does not
        name a readable regular file. Nothing is
        emitted in this case.

        @throw system::system_error with
        @ref error::double_response if a response
        was already emitted.
    */
    void
    send_file(
        core::string_view path,
        std::optional<std::string> fname = {},
        std::optional<content_type> ct = plain_text(),
        unsigned status = 200);

    /** Respond with a serialized JSON value

        The Content-Type is `application/json; charset=UTF-8`.
    */
    void
    send_json(
        json::value const& jv,
        unsigned status = 200);

    /** Respond with structured data

        The body and the Content-Type come from
        the data object.
    */
    template<serializable_data T>
    void
    send_api(
        T const& data,
        unsigned status = 200)
    {
        send_body(data.serialize(), data.type(), status);
    }

    /** Respond with an error

        The error's status, headers and body
        become the response.
    */
    void
    send_err(error_info const& e);

    /** Return `text/plain; charset=UTF-8`
    */
    static
    content_type
    plain_text();

private:
    friend class detail::endpoint_access;

    void
    begin_response();

    dispatch::request* req_ = nullptr;
    response res_;
    bool responded_ = false;
};

namespace detail {

// used by the dispatcher
class endpoint_access
{
public:
    static
    void
    attach(
        endpoint& ep,
        dispatch::request& req) noexcept
    {
        ep.req_ = &req;
    }

    static
    response&
    get_response(endpoint& ep) noexcept
    {
        return ep.res_;
    }
};

} // detail

} // dispatch
} // boost

#endif
