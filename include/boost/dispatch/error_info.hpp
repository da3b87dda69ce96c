//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_ERROR_INFO_HPP
#define BOOST_DISPATCH_ERROR_INFO_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/dispatch/fields.hpp>
#include <boost/dispatch/method.hpp>
#include <boost/dispatch/response.hpp>
#include <boost/dispatch/rfc/content_type.hpp>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace boost {
namespace dispatch {

/** A client-visible error response

    Handler code and argument sources throw objects of this
    type to stop processing and answer the request with a
    specific error. The dispatcher catches them and turns
    them into a @ref response.

    Objects are plain values: derived types only choose
    the initial status, headers and body, so an object
    may be copied or sliced without losing information.

    @par Example
    @code
    struct user_not_found : error_info
    {
        user_not_found()
            : error_info(400, "User not found.")
        {
        }
    };

    void do_get(std::string const& id)
    {
        if(! db.contains(id))
            throw user_not_found();
        ...
    }
    @endcode
*/
class BOOST_DISPATCH_SYMBOL_VISIBLE
    error_info
    : public std::exception
{
public:
    /** Constructor

        The response has no body.

        @param status The HTTP status code.
    */
    BOOST_DISPATCH_DECL
    explicit
    error_info(unsigned status = 400);

    /** Constructor

        @param status The HTTP status code.

        @param body The response body.

        @param type The media type of the body.
    */
    BOOST_DISPATCH_DECL
    error_info(
        unsigned status,
        std::string body,
        content_type type = { std::string(media_types::plain), {}, {} });

    BOOST_DISPATCH_DECL
    ~error_info() override;

    unsigned
    status() const noexcept
    {
        return status_;
    }

    fields const&
    headers() const noexcept
    {
        return headers_;
    }

    std::string const&
    body() const noexcept
    {
        return body_;
    }

    /** Return the media type of the body, if any
    */
    std::optional<content_type> const&
    body_type() const noexcept
    {
        return type_;
    }

    /** Add a header to the error response
    */
    error_info&
    add_header(
        core::string_view name,
        core::string_view value)
    {
        headers_.append(name, value);
        return *this;
    }

    BOOST_DISPATCH_DECL
    char const*
    what() const noexcept override;

    /** Return the response this error produces

        Content-Type and Content-Length are added when
        the body is not empty.
    */
    BOOST_DISPATCH_DECL
    response
    to_response() const;

protected:
    void
    set_body(
        std::string body,
        content_type type)
    {
        body_ = std::move(body);
        type_ = std::move(type);
    }

private:
    unsigned status_;
    fields headers_;
    std::string body_;
    std::optional<content_type> type_;
    std::string what_;
};

//------------------------------------------------

/// The default error for unmatched routes (404)
struct BOOST_DISPATCH_SYMBOL_VISIBLE
    not_found_error : error_info
{
    not_found_error()
        : error_info(404)
    {
    }
};

/// The default error for invalid request bodies (415)
struct BOOST_DISPATCH_SYMBOL_VISIBLE
    unsupported_media_type_error : error_info
{
    unsupported_media_type_error()
        : error_info(415)
    {
    }
};

/// The default error for missing required fields (400)
struct BOOST_DISPATCH_SYMBOL_VISIBLE
    header_not_found_error : error_info
{
    header_not_found_error()
        : error_info(400)
    {
    }
};

/// The default error for repeated unique fields (400)
struct BOOST_DISPATCH_SYMBOL_VISIBLE
    duplicate_value_error : error_info
{
    duplicate_value_error()
        : error_info(400)
    {
    }
};

/// The error for bodies exceeding the configured limit (413)
struct BOOST_DISPATCH_SYMBOL_VISIBLE
    payload_too_large_error : error_info
{
    payload_too_large_error()
        : error_info(413)
    {
    }
};

/** The error for methods a handler does not implement (405)

    The `Allow` header lists the given methods,
    comma-separated, in the order provided.
*/
struct BOOST_DISPATCH_SYMBOL_VISIBLE
    method_not_allowed_error : error_info
{
    BOOST_DISPATCH_DECL
    explicit
    method_not_allowed_error(
        std::vector<method> const& allowed);
};

/** An error with a JSON body describing an API failure

    The body has this shape, with absent members
    rendered as `null`:

    @code
    {
        "code": 1001,
        "developerMessage": "...",
        "userMessage": "...",
        "info": "..."
    }
    @endcode
*/
class BOOST_DISPATCH_SYMBOL_VISIBLE
    api_error_info : public error_info
{
public:
    struct params
    {
        std::optional<std::int64_t> code;
        std::optional<std::string> developer_message;
        std::optional<std::string> user_message;
        std::optional<std::string> info;
    };

    BOOST_DISPATCH_DECL
    api_error_info(
        unsigned status,
        params const& p);
};

} // dispatch
} // boost

#endif
