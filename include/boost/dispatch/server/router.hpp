//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_SERVER_ROUTER_HPP
#define BOOST_DISPATCH_SERVER_ROUTER_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/dispatch/server/parcel.hpp>
#include <boost/dispatch/server/route.hpp>
#include <boost/system/result.hpp>
#include <spdlog/fwd.h>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace boost {
namespace dispatch {

class handler_class;

/** The result of resolving a path
*/
struct resolved_match
{
    /// The handler bound to the route
    handler_class const* handler = nullptr;

    /// The values of the flexible segments, in route order
    std::vector<std::string> values;

    /// The parcel registered with the route
    dispatch::parcel const* parcel = nullptr;

    /// The route which matched
    dispatch::route const* route = nullptr;
};

//------------------------------------------------

/** A table mapping paths to handler classes

    Routes are added at startup. Afterwards the router
    is only read, and concurrent calls to @ref resolve
    need no synchronization.

    Resolution walks a tree with one level per segment.
    At each level the literal child whose spelling equals
    the token is tried first. Flexible children are tried
    after it, in registration order, if the literal branch
    does not lead to a complete match. A path matches only
    routes with the same number of segments.

    @par Example
    @code
    router r;
    r.add(route{ "users", segment::flexible() },
        handler_class::of<user_endpoint>());
    r.add(route{ "users", "me" },
        handler_class::of<me_endpoint>());

    auto rv = r.resolve({ "users", "me" });   // me_endpoint
    @endcode
*/
class BOOST_DISPATCH_DECL
    router
{
    struct impl;
    impl* impl_;

public:
    /** Constructor

        Registrations are logged to the default spdlog logger.
    */
    router();

    /** Constructor

        @param log The logger receiving registration messages.
    */
    explicit
    router(std::shared_ptr<spdlog::logger> log);

    ~router();
    router(router&&) noexcept;
    router& operator=(router&&) noexcept;

    /** Register a route

        @param r The route.

        @param h The handler class invoked for the route.

        @param p The parcel forwarded to the handler's `setup`.

        @throw system::system_error with @ref error::duplicate_route
        if an identical route is already registered, or
        @ref error::callback_mismatch if a callback of `h`
        does not fit the route.
    */
    void
    add(
        dispatch::route const& r,
        handler_class const& h,
        dispatch::parcel p = {});

    /** Register a route under several API versions

        For each version `n` the route is registered with a
        leading `v<n>` segment. An empty list registers the
        route without a prefix.

        @par Example
        @code
        // registers /v1/items and /v2/items
        r.add(route{"items"}, handler_class::of<items>(), {}, {1, 2});
        @endcode
    */
    void
    add(
        dispatch::route const& r,
        handler_class const& h,
        dispatch::parcel p,
        std::vector<unsigned> const& versions);

    /** Return the handler for a sequence of path segments

        @return The match, or @ref error::not_found.
    */
    system::result<resolved_match>
    resolve(std::vector<std::string> const& segments) const;

    /** Return the routes bound to a handler class, in registration order
    */
    std::vector<dispatch::route>
    routes_of(handler_class const& h) const;

    /** Return the number of registered routes
    */
    std::size_t
    size() const noexcept;
};

} // dispatch
} // boost

#endif
