//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_DATA_FORM_DATA_HPP
#define BOOST_DISPATCH_DATA_FORM_DATA_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/dispatch/data/structured_data.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace boost {
namespace dispatch {

/** Structured data holding an url-encoded form

    Every declared name is required and holds a string.
    A name appearing more than once fails validation.
    Undeclared names are dropped.
*/
class form_data
{
public:
    /** Constructor

        @param raw The payload bytes.

        @param ct The request's Content-Type. Its media type
        must be `application/x-www-form-urlencoded`. An absent
        charset means UTF-8, and no other charset is accepted.

        @param names The declared field names.

        @throw system::system_error with
        @ref error::validation_failed.
    */
    BOOST_DISPATCH_DECL
    form_data(
        core::string_view raw,
        std::optional<content_type> const& ct,
        std::vector<std::string> const& names);

    /** Return the value of a declared field

        @throw std::out_of_range if the name was not declared.
    */
    BOOST_DISPATCH_DECL
    std::string const&
    at(core::string_view name) const;

    /** Return the declared fields, in declaration order
    */
    std::vector<std::pair<std::string, std::string>> const&
    values() const noexcept
    {
        return v_;
    }

    BOOST_DISPATCH_DECL
    std::string
    serialize() const;

    BOOST_DISPATCH_DECL
    content_type
    type() const;

private:
    std::vector<std::pair<std::string, std::string>> v_;
};

} // dispatch
} // boost

#endif
