//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_RFC_CONTENT_TYPE_HPP
#define BOOST_DISPATCH_RFC_CONTENT_TYPE_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <optional>
#include <string>

namespace boost {
namespace dispatch {

/** Media types used by the library
*/
namespace media_types {

BOOST_INLINE_CONSTEXPR core::string_view json = "application/json";
BOOST_INLINE_CONSTEXPR core::string_view plain = "text/plain";
BOOST_INLINE_CONSTEXPR core::string_view form_urlencoded =
    "application/x-www-form-urlencoded";
BOOST_INLINE_CONSTEXPR core::string_view octet_stream =
    "application/octet-stream";

} // media_types

//------------------------------------------------

/** The value of a Content-Type field

    The media type and the charset are stored lower-case.
    The boundary is kept verbatim. Other parameters are
    not retained.
*/
struct content_type
{
    /** The media type, as `type/subtype`
    */
    std::string media_type;

    /** The charset parameter, if present
    */
    std::optional<std::string> charset;

    /** The boundary parameter, if present
    */
    std::optional<std::string> boundary;

    /** Return the serialized field value
    */
    BOOST_DISPATCH_DECL
    std::string
    to_string() const;
};

//------------------------------------------------

namespace implementation_defined {
struct content_type_rule_t
{
    using value_type = content_type;

    BOOST_DISPATCH_DECL
    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>;
};
} // implementation_defined

/** Rule matching a Content-Type field value

    @par BNF
    @code
    media-type  = type "/" subtype *( OWS ";" OWS parameter )
    parameter   = token "=" ( token / quoted-string )
    subtype     = token
    type        = token
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc9110#section-8.3.1"
        >8.3.1.  Media Type (rfc9110)</a>

    @see
        @ref content_type,
        @ref parse_content_type.
*/
BOOST_INLINE_CONSTEXPR implementation_defined::content_type_rule_t content_type_rule{};

/** Parse a complete Content-Type field value

    @par Example
    @code
    auto rv = parse_content_type("application/json; charset=UTF-8");
    assert(rv->charset == "utf-8");
    @endcode

    @return The parsed value, or an error if the
    string is not a valid media type.
*/
BOOST_DISPATCH_DECL
system::result<content_type>
parse_content_type(core::string_view s);

} // dispatch
} // boost

#endif
