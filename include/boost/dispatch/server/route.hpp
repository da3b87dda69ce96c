//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_SERVER_ROUTE_HPP
#define BOOST_DISPATCH_SERVER_ROUTE_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

namespace boost {
namespace dispatch {

/** One element of a route

    A literal segment matches a path token with the same
    spelling. A flexible segment matches any non-empty token
    satisfying its constraint, and the token is captured and
    passed to the callback.

    @par Example
    @code
    route r{ "users", segment::digits(6), "posts", segment::flexible() };
    @endcode
*/
class segment
{
public:
    enum class constraint : unsigned char
    {
        none,       // literal
        any,        // any non-empty token
        digits,     // exactly n decimal digits
        bounded     // between 1 and n characters
    };

    /** Constructor

        Constructs a literal segment.
    */
    segment(char const* s)
        : lit_(s)
    {
    }

    /// @copydoc segment(char const*)
    segment(std::string s)
        : lit_(std::move(s))
    {
    }

    /// @copydoc segment(char const*)
    segment(core::string_view s)
        : lit_(s)
    {
    }

    /** Return a flexible segment matching any non-empty token
    */
    static
    segment
    flexible() noexcept
    {
        return segment(constraint::any, 0);
    }

    /** Return a flexible segment matching exactly `n` digits

        @throw std::invalid_argument `n == 0`
    */
    BOOST_DISPATCH_DECL
    static
    segment
    digits(std::size_t n);

    /** Return a flexible segment matching at most `max` characters

        @throw std::invalid_argument `max == 0`
    */
    BOOST_DISPATCH_DECL
    static
    segment
    string(std::size_t max);

    bool
    is_flexible() const noexcept
    {
        return c_ != constraint::none;
    }

    constraint
    get_constraint() const noexcept
    {
        return c_;
    }

    /** Return the constraint's numeric parameter
    */
    std::size_t
    bound() const noexcept
    {
        return n_;
    }

    /** Return the spelling of a literal segment
    */
    std::string const&
    literal() const noexcept
    {
        return lit_;
    }

    /** Return true if a flexible segment accepts a token

        Literal segments never match through this function.
    */
    BOOST_DISPATCH_DECL
    bool
    matches(core::string_view token) const noexcept;

    /** Return a readable form, such as `{digits:4}`
    */
    BOOST_DISPATCH_DECL
    std::string
    to_string() const;

    /** Return true if the segments are interchangeable in a route

        Literals compare by spelling, flexible segments
        by constraint.
    */
    friend
    bool
    operator==(
        segment const& a,
        segment const& b) noexcept
    {
        return
            a.c_ == b.c_ &&
            a.n_ == b.n_ &&
            a.lit_ == b.lit_;
    }

private:
    segment(constraint c, std::size_t n) noexcept
        : c_(c)
        , n_(n)
    {
    }

    std::string lit_;
    constraint c_ = constraint::none;
    std::size_t n_ = 0;
};

//------------------------------------------------

/** An ordered sequence of segments
*/
class route
{
public:
    route() = default;

    route(std::initializer_list<segment> init)
        : v_(init)
    {
    }

    explicit
    route(std::vector<segment> v)
        : v_(std::move(v))
    {
    }

    std::vector<segment> const&
    segments() const noexcept
    {
        return v_;
    }

    std::size_t
    size() const noexcept
    {
        return v_.size();
    }

    /** Return the number of flexible segments
    */
    BOOST_DISPATCH_DECL
    std::size_t
    flexible_count() const noexcept;

    /** Return this route with a segment prepended
    */
    BOOST_DISPATCH_DECL
    route
    with_prefix(segment s) const;

    /** Return a readable form, such as `/users/{any}`
    */
    BOOST_DISPATCH_DECL
    std::string
    to_string() const;

    friend
    bool
    operator==(
        route const& a,
        route const& b) noexcept
    {
        return a.v_ == b.v_;
    }

private:
    std::vector<segment> v_;
};

} // dispatch
} // boost

#endif
