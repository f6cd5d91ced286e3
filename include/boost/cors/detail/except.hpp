//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CORS_DETAIL_EXCEPT_HPP
#define BOOST_CORS_DETAIL_EXCEPT_HPP

#include <boost/cors/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>

namespace boost {
namespace cors {
namespace detail {

BOOST_CORS_DECL BOOST_NORETURN void throw_invalid_argument(
    source_location const& loc = BOOST_CURRENT_LOCATION);

BOOST_CORS_DECL BOOST_NORETURN void throw_system_error(
    system::error_code const& ec,
    source_location const& loc = BOOST_CURRENT_LOCATION);

} // detail
} // cors
} // boost

#endif
