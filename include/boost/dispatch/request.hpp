//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_REQUEST_HPP
#define BOOST_DISPATCH_REQUEST_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/dispatch/fields.hpp>
#include <boost/dispatch/method.hpp>
#include <boost/dispatch/rfc/content_type.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace boost {
namespace dispatch {

/** A normalized request

    Transport adapters translate whatever they receive
    into this form before handing it to the dispatcher.
    Path segments and query parameters are stored
    percent-decoded. Header names compare as described
    in @ref field_name_equal.

    The body is not read until something asks for it.
    A body supplied through a reader is pulled once,
    up to the body limit, and cached.
*/
class request
{
public:
    /** A function which reads body bytes.

        The function is called with a destination buffer
        and its size, and returns the number of bytes
        written. Zero indicates the end of the body.
    */
    using body_reader = std::function<
        std::size_t(char*, std::size_t)>;

    request() = default;

    /** Return a request built from a method and an origin-form target

        The path is split into decoded segments and the
        query into decoded parameters.

        @par Example
        @code
        auto rv = request::from_target("GET", "/users/42?fields=name");
        @endcode

        @return The request, or the URL parsing error.
    */
    BOOST_DISPATCH_DECL
    static
    system::result<request>
    from_target(
        core::string_view method,
        core::string_view target);

    core::string_view
    method_string() const noexcept
    {
        return method_;
    }

    /** Return the method, normalized to the enumeration
    */
    BOOST_DISPATCH_DECL
    dispatch::method
    method() const noexcept;

    void
    set_method(core::string_view s)
    {
        method_.assign(s.data(), s.size());
    }

    std::vector<std::string> const&
    segments() const noexcept
    {
        return segments_;
    }

    void
    set_segments(std::vector<std::string> v)
    {
        segments_ = std::move(v);
    }

    fields&
    headers() noexcept
    {
        return headers_;
    }

    fields const&
    headers() const noexcept
    {
        return headers_;
    }

    /** Return the query parameters

        Names are case-sensitive, unlike header names.
    */
    std::vector<std::pair<std::string, std::string>> const&
    query() const noexcept
    {
        return query_;
    }

    void
    add_query(
        core::string_view name,
        core::string_view value)
    {
        query_.emplace_back(
            std::string(name), std::string(value));
    }

    /** Return every value of a query parameter, in order
    */
    BOOST_DISPATCH_DECL
    std::vector<std::string>
    query_values(core::string_view name) const;

    /** Set a body which is already in memory
    */
    BOOST_DISPATCH_DECL
    void
    set_body(std::string body);

    /** Set a body which is read on demand

        @param reader The function that produces the bytes.

        @param content_length The declared length, if known.
    */
    BOOST_DISPATCH_DECL
    void
    set_body_reader(
        body_reader reader,
        std::optional<std::size_t> content_length = {});

    std::optional<std::size_t>
    content_length() const noexcept
    {
        return content_length_;
    }

    std::size_t
    body_limit() const noexcept
    {
        return body_limit_;
    }

    void
    set_body_limit(std::size_t n) noexcept
    {
        body_limit_ = n;
    }

    /** Return the complete body

        The first call drains the reader.

        @throw system::system_error with @ref error::body_too_large
        if the declared or actual size exceeds @ref body_limit.
    */
    BOOST_DISPATCH_DECL
    std::string const&
    body();

private:
    std::string method_;
    std::vector<std::string> segments_;
    fields headers_;
    std::vector<std::pair<std::string, std::string>> query_;
    body_reader reader_;
    std::optional<std::size_t> content_length_;
    std::size_t body_limit_ =
        (std::numeric_limits<std::size_t>::max)();
    std::string body_;
    bool body_read_ = true;
};

/** Return the parsed Content-Type of a request

    @return The value, or an empty optional if the field
    is absent or malformed.
*/
BOOST_DISPATCH_DECL
std::optional<content_type>
get_content_type(request const& req);

} // dispatch
} // boost

#endif
