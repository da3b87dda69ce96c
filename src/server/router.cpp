//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/server/router.hpp>
#include <boost/dispatch/server/handler_class.hpp>
#include <boost/dispatch/error.hpp>
#include <boost/dispatch/detail/except.hpp>
#include <spdlog/spdlog.h>
#include <functional>
#include <map>

/*

registered                  path            match
------------------------------------------------------------
/users/{any}                /users/me       /users/{any}  ["me"]
/users/me                   /users/me       /users/me     []
/users/me/{any}/x           /users/me/a/x   /users/me/{any}/x
/users/{any}/a/y                            (literal "me" tried first)
/users/{any}                /users          no-match      depth
/users/{any}                /users/         no-match      empty token

*/

namespace boost {
namespace dispatch {

namespace {

struct entry
{
    dispatch::route r;
    handler_class const* h;
    dispatch::parcel p;
};

struct node
{
    std::map<std::string, std::unique_ptr<node>, std::less<>> literals;
    std::vector<std::pair<segment, std::unique_ptr<node>>> flexibles;
    entry const* leaf = nullptr;

    node&
    child(segment const& s)
    {
        if(! s.is_flexible())
        {
            auto& p = literals[s.literal()];
            if(! p)
                p = std::make_unique<node>();
            return *p;
        }
        for(auto& f : flexibles)
            if(f.first == s)
                return *f.second;
        flexibles.emplace_back(s, std::make_unique<node>());
        return *flexibles.back().second;
    }

    entry const*
    find(
        std::vector<std::string> const& segs,
        std::size_t i,
        std::vector<std::string>& values) const
    {
        if(i == segs.size())
            return leaf;
        auto it = literals.find(segs[i]);
        if(it != literals.end())
            if(auto e = it->second->find(segs, i + 1, values))
                return e;
        for(auto const& f : flexibles)
        {
            if(! f.first.matches(segs[i]))
                continue;
            values.push_back(segs[i]);
            if(auto e = f.second->find(segs, i + 1, values))
                return e;
            values.pop_back();
        }
        return nullptr;
    }
};

} // (anon)

struct router::impl
{
    node root;
    std::vector<std::unique_ptr<entry const>> entries;
    std::shared_ptr<spdlog::logger> log;

    explicit
    impl(std::shared_ptr<spdlog::logger> log_)
        : log(std::move(log_))
    {
    }
};

router::
router()
    : router(spdlog::default_logger())
{
}

router::
router(
    std::shared_ptr<spdlog::logger> log)
    : impl_(new impl(std::move(log)))
{
}

router::
~router()
{
    delete impl_;
}

router::
router(
    router&& other) noexcept
    : impl_(other.impl_)
{
    other.impl_ = nullptr;
}

router&
router::
operator=(
    router&& other) noexcept
{
    delete impl_;
    impl_ = other.impl_;
    other.impl_ = nullptr;
    return *this;
}

void
router::
add(
    dispatch::route const& r,
    handler_class const& h,
    dispatch::parcel p)
{
    // fails before anything is inserted
    h.check_route(r.flexible_count());

    node* n = &impl_->root;
    for(auto const& s : r.segments())
        n = &n->child(s);
    if(n->leaf)
    {
        impl_->log->error(
            "route {} is already bound to {}",
            r.to_string(), n->leaf->h->name());
        detail::throw_system_error(
            BOOST_DISPATCH_ERR(error::duplicate_route),
            r.to_string().c_str());
    }

    impl_->entries.push_back(std::make_unique<entry const>(
        entry{ r, &h, std::move(p) }));
    n->leaf = impl_->entries.back().get();
    impl_->log->debug("route {} -> {}",
        r.to_string(), h.name());
}

void
router::
add(
    dispatch::route const& r,
    handler_class const& h,
    dispatch::parcel p,
    std::vector<unsigned> const& versions)
{
    if(versions.empty())
        return add(r, h, std::move(p));
    for(auto v : versions)
        add(r.with_prefix("v" + std::to_string(v)), h, p);
}

auto
router::
resolve(
    std::vector<std::string> const& segments) const ->
        system::result<resolved_match>
{
    resolved_match m;
    auto const e = impl_->root.find(segments, 0, m.values);
    if(! e)
        return BOOST_DISPATCH_ERR(error::not_found);
    m.handler = e->h;
    m.parcel = &e->p;
    m.route = &e->r;
    return m;
}

std::vector<dispatch::route>
router::
routes_of(handler_class const& h) const
{
    std::vector<dispatch::route> v;
    for(auto const& e : impl_->entries)
        if(e->h == &h)
            v.push_back(e->r);
    return v;
}

std::size_t
router::
size() const noexcept
{
    return impl_->entries.size();
}

} // dispatch
} // boost
