//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include "test_suite.hpp"

#include <spdlog/spdlog.h>
#include <cstring>
#include <iostream>

// usage: boost_dispatch_tests [suite-name-prefix]
int
main(int argc, char** argv)
{
    // dispatcher diagnostics are noise here
    spdlog::set_level(spdlog::level::off);

    char const* filter = argc > 1 ? argv[1] : "";
    for(auto* r : test_suite::runners())
    {
        if(std::strncmp(r->name, filter, std::strlen(filter)) != 0)
            continue;
        std::cout << r->name << std::endl;
        r->run();
    }
    return boost::report_errors();
}
