//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/config.hpp>
#include <boost/dispatch/detail/except.hpp>
#include <spdlog/spdlog.h>

#include <memory>

namespace boost {
namespace dispatch {

std::shared_ptr<dispatcher_config const>
make_dispatcher_config(dispatcher_config cfg)
{
    if(cfg.body_limit < 1)
        detail::throw_invalid_argument(
            "body_limit must not be zero");

    if(! cfg.log)
        cfg.log = spdlog::default_logger();

    return std::make_shared<
        dispatcher_config const>(std::move(cfg));
}

} // dispatch
} // boost
