//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_HPP
#define BOOST_DISPATCH_HPP

#include <boost/dispatch/config.hpp>
#include <boost/dispatch/error.hpp>
#include <boost/dispatch/error_info.hpp>
#include <boost/dispatch/fields.hpp>
#include <boost/dispatch/method.hpp>
#include <boost/dispatch/request.hpp>
#include <boost/dispatch/response.hpp>

#include <boost/dispatch/data/binary_data.hpp>
#include <boost/dispatch/data/form_data.hpp>
#include <boost/dispatch/data/json_data.hpp>
#include <boost/dispatch/data/schema.hpp>
#include <boost/dispatch/data/structured_data.hpp>

#include <boost/dispatch/rfc/content_type.hpp>

#include <boost/dispatch/server/argument_source.hpp>
#include <boost/dispatch/server/dispatcher.hpp>
#include <boost/dispatch/server/endpoint.hpp>
#include <boost/dispatch/server/handler_class.hpp>
#include <boost/dispatch/server/parcel.hpp>
#include <boost/dispatch/server/route.hpp>
#include <boost/dispatch/server/router.hpp>
#include <boost/dispatch/server/statuses.hpp>

#endif
