//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CORS_DETAIL_CONFIG_HPP
#define BOOST_CORS_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <stdint.h>

namespace boost {

namespace cors {

//------------------------------------------------

# if (defined(BOOST_CORS_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(BOOST_CORS_STATIC_LINK)
#  if defined(BOOST_CORS_SOURCE)
#   define BOOST_CORS_DECL        BOOST_SYMBOL_EXPORT
#   define BOOST_CORS_BUILD_DLL
#  else
#   define BOOST_CORS_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  BOOST_CORS_DECL
#  define BOOST_CORS_DECL
# endif

#if defined(__MINGW32__)
    #define BOOST_CORS_SYMBOL_VISIBLE BOOST_CORS_DECL
#else
    #define BOOST_CORS_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

# if !defined(BOOST_CORS_SOURCE) && !defined(BOOST_ALL_NO_LIB) && !defined(BOOST_CORS_NO_LIB)
#  define BOOST_LIB_NAME boost_cors
#  if defined(BOOST_ALL_DYN_LINK) || defined(BOOST_CORS_DYN_LINK)
#   define BOOST_DYN_LINK
#  endif
#  include <boost/config/auto_link.hpp>
# endif

} // cors

// lift beast::http into our namespace
namespace beast {
namespace http {}
}
namespace cors {
namespace http = ::boost::beast::http;
} // cors

} // boost

#endif
