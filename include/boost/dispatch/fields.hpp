//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_FIELDS_HPP
#define BOOST_DISPATCH_FIELDS_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace boost {
namespace dispatch {

/** Return true if two field names are equivalent.

    Names compare case-insensitively, and a
    hyphen compares equal to an underscore, so
    `Content-Type` and `content_type` name the
    same field.
*/
BOOST_DISPATCH_DECL
bool
field_name_equal(
    core::string_view s0,
    core::string_view s1) noexcept;

//------------------------------------------------

/** An ordered, multi-valued collection of fields

    Insertion order is preserved. A name may appear
    more than once; lookups use @ref field_name_equal.
*/
class fields
{
public:
    using value_type =
        std::pair<std::string, std::string>;
    using const_iterator =
        std::vector<value_type>::const_iterator;

    fields() = default;

    fields(std::initializer_list<value_type> init)
        : v_(init)
    {
    }

    const_iterator begin() const noexcept { return v_.begin(); }
    const_iterator end() const noexcept { return v_.end(); }
    std::size_t size() const noexcept { return v_.size(); }
    bool empty() const noexcept { return v_.empty(); }

    /** Append a field, keeping existing ones
    */
    BOOST_DISPATCH_DECL
    void
    append(
        core::string_view name,
        core::string_view value);

    /** Replace every field with this name by a single value
    */
    BOOST_DISPATCH_DECL
    void
    set(
        core::string_view name,
        core::string_view value);

    /** Remove every field with this name

        @return The number of fields removed.
    */
    BOOST_DISPATCH_DECL
    std::size_t
    erase(core::string_view name) noexcept;

    BOOST_DISPATCH_DECL
    bool
    exists(core::string_view name) const noexcept;

    BOOST_DISPATCH_DECL
    std::size_t
    count(core::string_view name) const noexcept;

    /** Return the first value for a name, or an empty string
    */
    BOOST_DISPATCH_DECL
    core::string_view
    value_or(
        core::string_view name,
        core::string_view def = {}) const noexcept;

    /** Return every value for a name, in order
    */
    BOOST_DISPATCH_DECL
    std::vector<std::string>
    find_all(core::string_view name) const;

private:
    std::vector<value_type> v_;
};

} // dispatch
} // boost

#endif
