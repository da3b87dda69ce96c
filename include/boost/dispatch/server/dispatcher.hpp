//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_SERVER_DISPATCHER_HPP
#define BOOST_DISPATCH_SERVER_DISPATCHER_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/dispatch/config.hpp>
#include <boost/dispatch/request.hpp>
#include <boost/dispatch/response.hpp>
#include <boost/dispatch/server/router.hpp>
#include <memory>

namespace boost {
namespace dispatch {

/** Turns requests into responses using a router

    For each request the dispatcher resolves the path,
    creates the handler's endpoint, forwards the parcel to
    its `setup`, runs the argument sources of the callback
    registered for the method, and invokes the callback.

    Errors never escape @ref handle:

    @li An unmatched path answers with the configured
        not-found error (404 by default).
    @li A method the handler does not implement answers
        405 with an `Allow` header.
    @li A thrown @ref error_info answers with that error.
    @li A body larger than the limit answers 413.
    @li Anything else, including configuration faults and
        broken response protocol, answers 500 with no body
        and is logged.

    Responses to HEAD requests, and responses whose status
    forbids a body, carry no body.

    The dispatcher is stateless apart from its references,
    so one object may serve concurrent requests.
*/
class BOOST_DISPATCH_DECL
    dispatcher
{
public:
    /** Constructor

        The router must outlive the dispatcher.
    */
    explicit
    dispatcher(router const& r);

    /** Constructor

        @param r The router, which must outlive the dispatcher.

        @param cfg The configuration, from @ref make_dispatcher_config.
    */
    dispatcher(
        router const& r,
        std::shared_ptr<dispatcher_config const> cfg);

    /** Return the response for a request
    */
    response
    handle(request& req) const;

private:
    response
    invoke(request& req) const;

    router const& r_;
    std::shared_ptr<dispatcher_config const> cfg_;
};

} // dispatch
} // boost

#endif
