//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_DATA_JSON_DATA_HPP
#define BOOST_DISPATCH_DATA_JSON_DATA_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/dispatch/data/schema.hpp>
#include <boost/dispatch/data/structured_data.hpp>
#include <boost/json/object.hpp>
#include <optional>
#include <string>

namespace boost {
namespace dispatch {

/** Structured data holding a JSON object validated by a schema

    Derived types supply the schema and usually copy the
    validated members into typed fields.

    @par Example
    @code
    struct credentials : json_data
    {
        std::string user;

        static schema const& get_schema()
        {
            static schema const s = schema()
                .required("user", field_type::string());
            return s;
        }

        credentials(
            core::string_view raw,
            std::optional<content_type> const& ct)
            : json_data(raw, ct, get_schema())
            , user(value().at("user").as_string())
        {
        }
    };
    @endcode
*/
class json_data
{
public:
    /** Constructor

        Validates a request payload.

        @param raw The payload bytes.

        @param ct The request's Content-Type. Its media type
        must be `application/json`. An absent charset means
        UTF-8, and no other charset is accepted.

        @param s The schema to validate against.

        @throw system::system_error with
        @ref error::validation_failed.
    */
    BOOST_DISPATCH_DECL
    json_data(
        core::string_view raw,
        std::optional<content_type> const& ct,
        schema const& s);

    /** Constructor

        Validates an object built by the application,
        typically for a response.

        @throw system::system_error with
        @ref error::validation_failed.
    */
    BOOST_DISPATCH_DECL
    json_data(
        json::object const& obj,
        schema const& s);

    /** Return the validated object

        Only declared fields are present.
    */
    json::object const&
    value() const noexcept
    {
        return obj_;
    }

    BOOST_DISPATCH_DECL
    std::string
    serialize() const;

    BOOST_DISPATCH_DECL
    content_type
    type() const;

private:
    json::object obj_;
};

} // dispatch
} // boost

#endif
