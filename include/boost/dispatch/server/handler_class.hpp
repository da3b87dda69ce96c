//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_SERVER_HANDLER_CLASS_HPP
#define BOOST_DISPATCH_SERVER_HANDLER_CLASS_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/dispatch/detail/except.hpp>
#include <boost/dispatch/error.hpp>
#include <boost/dispatch/error_info.hpp>
#include <boost/dispatch/method.hpp>
#include <boost/dispatch/request.hpp>
#include <boost/dispatch/server/argument_source.hpp>
#include <boost/dispatch/server/endpoint.hpp>
#include <boost/dispatch/server/parcel.hpp>
#include <boost/core/demangle.hpp>
#include <any>
#include <array>
#include <concepts>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace boost {
namespace dispatch {

template<class H>
class method_table;

/** Describes one callback of a handler type
*/
struct callback_info
{
    /// The method the callback answers
    dispatch::method method;

    /// The number of callback parameters
    std::size_t arity = 0;

    /// Descriptions of the argument sources, innermost first
    std::vector<std::string> sources;

    /// Errors the callback or its sources may throw
    std::vector<error_info> may_occur;

    /// The declared output data type, if any
    std::optional<std::type_index> produces;
};

//------------------------------------------------

/** A type-erased handler type

    A `handler_class` knows how to create an @ref endpoint
    of a particular derived type, forward a parcel to its
    `setup`, and invoke the callback registered for a
    method. There is exactly one object per handler type,
    obtained with @ref of.

    @par Example
    @code
    router r;
    r.add(route{"hello"}, handler_class::of<hello>());
    @endcode
*/
class BOOST_DISPATCH_DECL
    handler_class
{
public:
    virtual ~handler_class();

    handler_class(handler_class const&) = delete;
    handler_class& operator=(handler_class const&) = delete;

    /** Return the handler class for `H`

        `H` must derive from @ref endpoint, be default
        constructible, and declare
        `static void methods(method_table<H>&)`.
    */
    template<class H>
    static
    handler_class const&
    of();

    /** Return the demangled name of the handler type
    */
    virtual
    std::string
    name() const = 0;

    /** Return a new endpoint object
    */
    virtual
    std::unique_ptr<endpoint>
    create() const = 0;

    /** Forward a parcel to the endpoint's `setup`

        @throw system::system_error with
        @ref error::parcel_mismatch if the parcel does
        not match the parameters of `setup`.
    */
    virtual
    void
    setup(
        endpoint& ep,
        dispatch::parcel const& p) const = 0;

    /** Return the implemented methods, in enumeration order
    */
    virtual
    std::vector<dispatch::method>
    methods() const = 0;

    /** Return true if a callback is registered for `m`
    */
    virtual
    bool
    implements(dispatch::method m) const noexcept = 0;

    /** Invoke the callback for `m`

        Argument sources run outermost first, then the
        callback receives the captured values followed
        by the injected values, innermost first.

        @par Preconditions
        @code
        implements(m)
        @endcode
    */
    virtual
    void
    invoke(
        dispatch::method m,
        endpoint& ep,
        std::vector<std::string> const& captured) const = 0;

    /** Check every callback against a route

        @throw system::system_error with
        @ref error::callback_mismatch if a callback's
        parameters do not consist of `flexible_count`
        strings followed by the types its sources produce.
    */
    virtual
    void
    check_route(std::size_t flexible_count) const = 0;

    /** Return a description of every callback
    */
    virtual
    std::vector<callback_info>
    callbacks() const = 0;

protected:
    handler_class() = default;
};

//------------------------------------------------

namespace detail {

// one registered callback of H
template<class H>
struct callback_entry
{
    using invoker = void(*)(
        void const* fn, H&, std::vector<std::any>&);

    dispatch::method method;
    std::vector<std::type_index> params;
    std::vector<std::shared_ptr<argument_source const>> sources;
    std::vector<error_info> may_occur;
    std::optional<std::type_index> produces;
    std::shared_ptr<void const> fn;
    invoker call = nullptr;
};

template<class H, class... Args>
void
call_member(
    void const* fn,
    H& h,
    std::vector<std::any>& args)
{
    using pmf = void (H::*)(Args...);
    auto const f = *static_cast<pmf const*>(fn);
    [&]<std::size_t... I>(std::index_sequence<I...>)
    {
        (h.*f)(*std::any_cast<
            std::decay_t<Args>>(&args[I])...);
    }(std::index_sequence_for<Args...>{});
}

template<class H>
concept has_setup = requires { &H::setup; };

template<class H, class... Args>
void
call_setup(
    H& h,
    void (H::*f)(Args...),
    dispatch::parcel const& p)
{
    if(p.size() != sizeof...(Args))
        detail::throw_system_error(
            BOOST_DISPATCH_ERR(error::parcel_mismatch),
            "parcel size does not match setup");
    bool const ok = [&]<std::size_t... I>(std::index_sequence<I...>)
    {
        return (( std::any_cast<std::decay_t<Args>>(
            &p[I]) != nullptr ) && ...);
    }(std::index_sequence_for<Args...>{});
    if(! ok)
        detail::throw_system_error(
            BOOST_DISPATCH_ERR(error::parcel_mismatch),
            "parcel types do not match setup");
    [&]<std::size_t... I>(std::index_sequence<I...>)
    {
        (h.*f)(*std::any_cast<
            std::decay_t<Args>>(&p[I])...);
    }(std::index_sequence_for<Args...>{});
}

// verifies a callback against a route,
// throws callback_mismatch on failure
BOOST_DISPATCH_DECL
void
check_callback(
    core::string_view handler,
    dispatch::method m,
    std::vector<std::type_index> const& params,
    std::vector<std::shared_ptr<argument_source const>> const& sources,
    std::size_t flexible_count);

// runs the sources outermost first and
// appends their values innermost first
BOOST_DISPATCH_DECL
void
extract_arguments(
    std::vector<std::shared_ptr<argument_source const>> const& sources,
    request& req,
    std::vector<std::any>& args);

template<class H>
class handler_class_impl;

} // detail

//------------------------------------------------

/** Declares the callbacks of a handler type

    A handler type fills its table in a static
    `methods` function:

    @code
    static void methods(method_table<upsidedown>& t)
    {
        t.on(method::get, &upsidedown::do_get)
            .wrap(body_of<upsidedown_request>())
            .produces<upsidedown_response>();
    }
    @endcode

    The first call to `wrap` attaches the source closest
    to the callback. Its value follows the captured path
    values directly in the parameter list.
*/
template<class H>
class method_table
{
public:
    /** Configures the callback just added
    */
    class callback_builder
    {
    public:
        /** Attach an argument source as the new outermost wrapper
        */
        template<class Source>
            requires std::derived_from<
                std::decay_t<Source>, argument_source>
        callback_builder&
        wrap(Source&& s)
        {
            e_->sources.push_back(std::make_shared<
                std::decay_t<Source> const>(
                    std::forward<Source>(s)));
            return *this;
        }

        /** Declare errors the callback may throw

            This is metadata and does not change dispatch.
        */
        template<class... Errors>
        callback_builder&
        may_occur(Errors const&... errs)
        {
            (e_->may_occur.push_back(errs), ...);
            return *this;
        }

        /** Declare the structured data type the callback sends

            This is metadata and does not change dispatch.
        */
        template<class T>
        callback_builder&
        produces()
        {
            e_->produces = std::type_index(typeid(T));
            return *this;
        }

    private:
        friend class method_table;

        explicit
        callback_builder(
            detail::callback_entry<H>& e) noexcept
            : e_(&e)
        {
        }

        detail::callback_entry<H>* e_;
    };

    /** Register the callback for a method

        @throw std::invalid_argument if `m` is
        @ref method::unknown or already registered.
    */
    template<class... Args>
    callback_builder
    on(dispatch::method m, void (H::*fn)(Args...))
    {
        static_assert(
            (! std::is_rvalue_reference_v<Args> && ...),
            "callback parameters must not be rvalue references");
        if(m == dispatch::method::unknown)
            detail::throw_invalid_argument(
                "method_table::on: unknown method");
        auto& slot = table_[static_cast<std::size_t>(m)];
        if(slot)
            detail::throw_invalid_argument(
                "method_table::on: duplicate method");
        using pmf = void (H::*)(Args...);
        slot.emplace();
        slot->method = m;
        slot->params = { std::type_index(
            typeid(std::decay_t<Args>))... };
        slot->fn = std::make_shared<pmf const>(fn);
        slot->call = &detail::call_member<H, Args...>;
        return callback_builder(*slot);
    }

private:
    friend class detail::handler_class_impl<H>;

    std::array<std::optional<
        detail::callback_entry<H>>,
            method_count + 1> table_;
};

//------------------------------------------------

namespace detail {

template<class H>
class handler_class_impl final
    : public handler_class
{
    method_table<H> t_;

public:
    handler_class_impl()
    {
        H::methods(t_);
    }

    std::string
    name() const override
    {
        return core::demangle(typeid(H).name());
    }

    std::unique_ptr<endpoint>
    create() const override
    {
        return std::make_unique<H>();
    }

    void
    setup(
        endpoint& ep,
        dispatch::parcel const& p) const override
    {
        auto& h = static_cast<H&>(ep);
        if constexpr(has_setup<H>)
        {
            call_setup(h, &H::setup, p);
        }
        else
        {
            if(! p.empty())
                detail::throw_system_error(
                    BOOST_DISPATCH_ERR(error::parcel_mismatch),
                    "handler has no setup");
        }
    }

    std::vector<dispatch::method>
    methods() const override
    {
        std::vector<dispatch::method> v;
        for(auto const& e : t_.table_)
            if(e)
                v.push_back(e->method);
        return v;
    }

    bool
    implements(dispatch::method m) const noexcept override
    {
        return t_.table_[static_cast<std::size_t>(m)].has_value();
    }

    void
    invoke(
        dispatch::method m,
        endpoint& ep,
        std::vector<std::string> const& captured) const override
    {
        auto const& e = *t_.table_[static_cast<std::size_t>(m)];
        std::vector<std::any> args;
        args.reserve(captured.size() + e.sources.size());
        for(auto const& s : captured)
            args.emplace_back(s);
        extract_arguments(e.sources, ep.request(), args);
        e.call(e.fn.get(), static_cast<H&>(ep), args);
    }

    void
    check_route(std::size_t flexible_count) const override
    {
        for(auto const& e : t_.table_)
            if(e)
                check_callback(name(), e->method,
                    e->params, e->sources, flexible_count);
    }

    std::vector<callback_info>
    callbacks() const override
    {
        std::vector<callback_info> v;
        for(auto const& e : t_.table_)
        {
            if(! e)
                continue;
            callback_info ci;
            ci.method = e->method;
            ci.arity = e->params.size();
            ci.may_occur = e->may_occur;
            for(auto const& s : e->sources)
            {
                ci.sources.push_back(s->describe());
                for(auto& err : s->errors())
                    ci.may_occur.push_back(std::move(err));
            }
            ci.produces = e->produces;
            v.push_back(std::move(ci));
        }
        return v;
    }
};

} // detail

template<class H>
handler_class const&
handler_class::
of()
{
    static_assert(std::derived_from<H, endpoint>,
        "H must derive from endpoint");
    static detail::handler_class_impl<H> const hc;
    return hc;
}

} // dispatch
} // boost

#endif
