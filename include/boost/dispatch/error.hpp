//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_ERROR_HPP
#define BOOST_DISPATCH_ERROR_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/system/error_code.hpp>

namespace boost {
namespace dispatch {

/** Error codes returned by the dispatch library
*/
enum class error
{
    /// No registered route matches the path
    not_found = 1,

    /// The handler does not implement the method
    method_not_allowed,

    /// A payload failed structured data validation
    validation_failed,

    /// An identical route was already registered
    duplicate_route,

    /// The parcel does not match the handler's setup signature
    parcel_mismatch,

    /** The callback signature does not match its route

        The number or types of the callback parameters
        differ from the captured segments and the values
        injected by its argument sources.
    */
    callback_mismatch,

    /// A response was already emitted for this request
    double_response,

    /// The callback returned without emitting a response
    no_response,

    /// The request body exceeds the configured limit
    body_too_large
};

//------------------------------------------------

/** Error conditions corresponding to sets of error codes.
*/
enum class condition
{
    /** The application registered something inconsistent

        These errors are detected at startup or, for
        parcels, when the handler is first instantiated.
        They indicate a programming error rather than
        a bad request.
    */
    configuration_error = 1,

    /** The handler broke the response protocol
    */
    protocol_violation
};

} // dispatch
} // boost

#include <boost/dispatch/impl/error.hpp>

#endif
