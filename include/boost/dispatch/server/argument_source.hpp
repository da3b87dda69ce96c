//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_SERVER_ARGUMENT_SOURCE_HPP
#define BOOST_DISPATCH_SERVER_ARGUMENT_SOURCE_HPP

#include <boost/dispatch/detail/config.hpp>
#include <boost/dispatch/data/structured_data.hpp>
#include <boost/dispatch/error.hpp>
#include <boost/dispatch/error_info.hpp>
#include <boost/dispatch/request.hpp>
#include <boost/system/system_error.hpp>
#include <any>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace boost {
namespace dispatch {

/** Produces one argument for a callback

    Argument sources are attached to a callback when its
    handler declares its methods, and are immutable from
    then on. At dispatch time each source extracts its
    value from the request, or throws an @ref error_info
    which becomes the response.

    @see
        @ref header_of,
        @ref query_of,
        @ref body_of.
*/
class BOOST_DISPATCH_DECL
    argument_source
{
public:
    virtual ~argument_source();

    /** Return the type of the value produced by @ref extract
    */
    virtual
    std::type_index
    value_type() const noexcept = 0;

    /** Return the argument for a request

        @throw error_info if the request does
        not satisfy this source.
    */
    virtual
    std::any
    extract(request& req) const = 0;

    /** Return the errors this source may throw
    */
    virtual
    std::vector<error_info>
    errors() const = 0;

    /** Return a short description for diagnostics
    */
    virtual
    std::string
    describe() const = 0;
};

//------------------------------------------------

namespace detail {

enum class value_origin
{
    header,
    query
};

BOOST_DISPATCH_DECL
std::vector<std::string>
raw_values(
    request const& req,
    value_origin origin,
    std::string const& name);

BOOST_DISPATCH_DECL
std::string
describe_origin(
    value_origin origin,
    std::string const& name);

} // detail

/** An argument taken from header fields or query parameters

    With no policy the callback receives a `std::optional<T>`
    holding the first value, if any. Policies change this:

    @li @ref required throws an error when the name is absent,
        and the callback receives a plain `T`.

    @li @ref unique throws an error when the name appears
        more than once.

    @li @ref all makes the callback receive a `std::vector<T>`
        with every value in order.

    @li @ref map converts every value, independently of the
        count policies.

    Each function returns a modified copy.

    @par Example
    @code
    t.on(method::get, &items::do_get)
        .wrap(query_of("page").unique().map(
            [](std::string const& s) { return std::stoi(s); }))
        .wrap(header_of("Authorization").required());

    void do_get(std::optional<int> page, std::string auth);
    @endcode
*/
template<class T>
class value_source : public argument_source
{
public:
    using converter = std::function<T(std::string const&)>;

    value_source(
        detail::value_origin origin,
        std::string name,
        converter conv)
        : origin_(origin)
        , name_(std::move(name))
        , conv_(std::move(conv))
    {
    }

    /** Throw `err` when the name is absent

        The callback receives a plain `T`
        instead of an optional.
    */
    value_source
    required(error_info err = header_not_found_error()) const
    {
        auto v = *this;
        v.absent_err_ = std::move(err);
        return v;
    }

    /** Throw `err` when the name appears more than once
    */
    value_source
    unique(error_info err = duplicate_value_error()) const
    {
        auto v = *this;
        v.unique_err_ = std::move(err);
        return v;
    }

    /** Inject every value as a `std::vector<T>`
    */
    value_source
    all() const
    {
        auto v = *this;
        v.all_ = true;
        return v;
    }

    /** Apply a function to every extracted value
    */
    template<class F>
    auto
    map(F f) const ->
        value_source<std::decay_t<
            std::invoke_result_t<F&, T>>>
    {
        using U = std::decay_t<
            std::invoke_result_t<F&, T>>;
        value_source<U> v(origin_, name_,
            [conv = conv_, f = std::move(f)](
                std::string const& s) mutable -> U
            {
                return f(conv(s));
            });
        v.absent_err_ = absent_err_;
        v.unique_err_ = unique_err_;
        v.all_ = all_;
        return v;
    }

    std::type_index
    value_type() const noexcept override
    {
        if(all_)
            return typeid(std::vector<T>);
        if(absent_err_)
            return typeid(T);
        return typeid(std::optional<T>);
    }

    std::any
    extract(request& req) const override
    {
        auto const raw = detail::raw_values(
            req, origin_, name_);
        if(raw.empty() && absent_err_)
            throw *absent_err_;
        if(raw.size() > 1 && unique_err_)
            throw *unique_err_;
        if(all_)
        {
            std::vector<T> v;
            v.reserve(raw.size());
            for(auto const& s : raw)
                v.push_back(conv_(s));
            return v;
        }
        if(absent_err_)
            return conv_(raw.front());
        if(raw.empty())
            return std::optional<T>();
        return std::optional<T>(conv_(raw.front()));
    }

    std::vector<error_info>
    errors() const override
    {
        std::vector<error_info> v;
        if(absent_err_)
            v.push_back(*absent_err_);
        if(unique_err_)
            v.push_back(*unique_err_);
        return v;
    }

    std::string
    describe() const override
    {
        return detail::describe_origin(origin_, name_);
    }

private:
    template<class> friend class value_source;

    detail::value_origin origin_;
    std::string name_;
    converter conv_;
    std::optional<error_info> absent_err_;
    std::optional<error_info> unique_err_;
    bool all_ = false;
};

/** Return a source reading a request header

    Names match as described in @ref field_name_equal.
*/
inline
value_source<std::string>
header_of(std::string name)
{
    return value_source<std::string>(
        detail::value_origin::header,
        std::move(name),
        [](std::string const& s) { return s; });
}

/** Return a source reading a query parameter

    Names match exactly.
*/
inline
value_source<std::string>
query_of(std::string name)
{
    return value_source<std::string>(
        detail::value_origin::query,
        std::move(name),
        [](std::string const& s) { return s; });
}

//------------------------------------------------

/** An argument built from the request body

    The callback receives a `T` constructed from the body
    bytes and the request's Content-Type. A validation
    failure throws the configured error instead.

    Other exceptions, including @ref error::body_too_large,
    propagate unchanged.
*/
template<structured_data T>
class body_source : public argument_source
{
public:
    explicit
    body_source(
        error_info err = unsupported_media_type_error())
        : err_(std::move(err))
    {
    }

    std::type_index
    value_type() const noexcept override
    {
        return typeid(T);
    }

    std::any
    extract(request& req) const override
    {
        auto const ct = get_content_type(req);
        auto const& raw = req.body();
        try
        {
            return T(core::string_view(raw), ct);
        }
        catch(system::system_error const& e)
        {
            if(e.code() != error::validation_failed)
                throw;
        }
        throw err_;
    }

    std::vector<error_info>
    errors() const override
    {
        return { err_ };
    }

    std::string
    describe() const override
    {
        return "body";
    }

private:
    error_info err_;
};

/** Return a source validating the request body as `T`

    @par Example
    @code
    t.on(method::post, &users::do_post)
        .wrap(body_of<user_register_input>());

    void do_post(user_register_input const& in);
    @endcode
*/
template<structured_data T>
body_source<T>
body_of(error_info err = unsupported_media_type_error())
{
    return body_source<T>(std::move(err));
}

} // dispatch
} // boost

#endif
