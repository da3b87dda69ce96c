//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_DISPATCH_DETAIL_CONFIG_HPP
#define BOOST_DISPATCH_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <stdint.h>

namespace boost {

namespace dispatch {

//------------------------------------------------

# if (defined(BOOST_DISPATCH_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(BOOST_DISPATCH_STATIC_LINK)
#  if defined(BOOST_DISPATCH_SOURCE)
#   define BOOST_DISPATCH_DECL        BOOST_SYMBOL_EXPORT
#   define BOOST_DISPATCH_BUILD_DLL
#  else
#   define BOOST_DISPATCH_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  BOOST_DISPATCH_DECL
#  define BOOST_DISPATCH_DECL
# endif

#if defined(__MINGW32__)
    #define BOOST_DISPATCH_SYMBOL_VISIBLE BOOST_DISPATCH_DECL
#else
    #define BOOST_DISPATCH_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

# if !defined(BOOST_DISPATCH_SOURCE) && !defined(BOOST_ALL_NO_LIB) && !defined(BOOST_DISPATCH_NO_LIB)
#  define BOOST_LIB_NAME boost_dispatch
#  if defined(BOOST_ALL_DYN_LINK) || defined(BOOST_DISPATCH_DYN_LINK)
#   define BOOST_DYN_LINK
#  endif
#  include <boost/config/auto_link.hpp>
# endif

//-----------------------------------------------

// Add source location to error codes
#ifdef BOOST_DISPATCH_NO_SOURCE_LOCATION
# define BOOST_DISPATCH_ERR(ev) (::boost::system::error_code(ev))
# define BOOST_DISPATCH_RETURN_EC(ev) return (ev)
#else
# define BOOST_DISPATCH_ERR(ev) ( \
    ::boost::system::error_code( (ev), [] { \
    static constexpr auto loc((BOOST_CURRENT_LOCATION)); \
    return &loc; }()))
# define BOOST_DISPATCH_RETURN_EC(ev)                                  \
    do {                                                                 \
        static constexpr auto loc ## __LINE__((BOOST_CURRENT_LOCATION)); \
        return ::boost::system::error_code((ev), &loc ## __LINE__);      \
    } while(0)
#endif

} // dispatch

// lift grammar into our namespace
namespace urls {
namespace grammar {}
}
namespace dispatch {
namespace grammar = ::boost::urls::grammar;
} // dispatch

} // boost

#endif
