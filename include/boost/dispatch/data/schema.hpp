//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_DATA_SCHEMA_HPP
#define BOOST_DISPATCH_DATA_SCHEMA_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace boost {
namespace dispatch {

class schema;

/** The declared type of a schema field
*/
class field_type
{
public:
    enum class kind
    {
        string,
        integer,    // int64 or uint64, never bool
        number,     // integer or double
        boolean,
        object,     // any JSON object, unchecked
        null,
        list,       // array whose elements all match
        nested      // object matching a schema
    };

    static field_type string() { return field_type(kind::string); }
    static field_type integer() { return field_type(kind::integer); }
    static field_type number() { return field_type(kind::number); }
    static field_type boolean() { return field_type(kind::boolean); }
    static field_type object() { return field_type(kind::object); }
    static field_type null() { return field_type(kind::null); }

    /** Return a list type with the given element type
    */
    BOOST_DISPATCH_DECL
    static
    field_type
    list_of(field_type element);

    /** Return an object type checked against a schema
    */
    BOOST_DISPATCH_DECL
    static
    field_type
    nested(schema s);

    kind
    get_kind() const noexcept
    {
        return k_;
    }

    /** Return the element type of a list

        @par Preconditions
        @code
        get_kind() == kind::list
        @endcode
    */
    field_type const&
    element() const noexcept
    {
        return *elem_;
    }

    /** Return the schema of a nested object

        @par Preconditions
        @code
        get_kind() == kind::nested
        @endcode
    */
    schema const&
    nested_schema() const noexcept
    {
        return *nested_;
    }

private:
    explicit
    field_type(kind k) noexcept
        : k_(k)
    {
    }

    kind k_;
    std::shared_ptr<field_type const> elem_;
    std::shared_ptr<schema const> nested_;
};

//------------------------------------------------

/** What to do with members a schema does not declare
*/
enum class extra_fields
{
    /// Drop them from the validated object
    ignore,

    /// Fail validation
    reject
};

/** A declared field of a schema
*/
struct schema_field
{
    std::string name;
    field_type type;

    /** True if the field may be absent or null
    */
    bool optional = false;

    /** The value used when an optional field is absent
    */
    json::value default_value;
};

//------------------------------------------------

/** The declared shape of a JSON object

    A schema is plain data interpreted by @ref validate.

    @par Example
    @code
    schema s;
    s.required("email", field_type::string())
     .required("age", field_type::integer())
     .optional("tags", field_type::list_of(field_type::string()));
    @endcode
*/
class schema
{
public:
    schema() = default;

    explicit
    schema(extra_fields policy) noexcept
        : policy_(policy)
    {
    }

    /** Declare a required field

        @throw std::invalid_argument if the name is
        already declared.
    */
    BOOST_DISPATCH_DECL
    schema&
    required(
        std::string name,
        field_type t);

    /** Declare an optional field

        An absent field is stored in the validated object
        as `def`, which defaults to `null`. An explicit
        `null` is accepted.

        @throw std::invalid_argument if the name is
        already declared.
    */
    BOOST_DISPATCH_DECL
    schema&
    optional(
        std::string name,
        field_type t,
        json::value def = nullptr);

    std::vector<schema_field> const&
    fields() const noexcept
    {
        return fields_;
    }

    extra_fields
    policy() const noexcept
    {
        return policy_;
    }

    void
    set_policy(extra_fields policy) noexcept
    {
        policy_ = policy;
    }

    /** Validate a JSON value against this schema

        @return A new object holding only the declared
        fields, with defaults filled in.

        @throw system::system_error with
        @ref error::validation_failed; the message
        names the offending field.
    */
    BOOST_DISPATCH_DECL
    json::object
    validate(json::value const& v) const;

private:
    json::object
    validate(
        json::value const& v,
        std::string const& path) const;

    static
    json::value
    check(
        json::value const& v,
        field_type const& t,
        std::string const& path);

    std::vector<schema_field> fields_;
    extra_fields policy_ = extra_fields::ignore;
};

} // dispatch
} // boost

#endif
