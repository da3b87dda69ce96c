//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_TEST_SUITE_HPP
#define BOOST_DISPATCH_TEST_SUITE_HPP

#include <boost/core/lightweight_test.hpp>
#include <vector>

namespace test_suite {

struct any_runner
{
    char const* name;

    explicit
    any_runner(char const* name_) noexcept
        : name(name_)
    {
    }

    virtual ~any_runner() = default;
    virtual void run() = 0;
};

inline
std::vector<any_runner*>&
runners()
{
    static std::vector<any_runner*> v;
    return v;
}

template<class T>
struct runner : any_runner
{
    explicit
    runner(char const* name_)
        : any_runner(name_)
    {
        runners().push_back(this);
    }

    void
    run() override
    {
        T t;
        t.run();
    }
};

} // test_suite

#define TEST_SUITE(type, name) \
    static ::test_suite::runner<type> type##_runner_(name)

#endif
