//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CORS_HPP
#define BOOST_CORS_HPP

#include <boost/cors/classify.hpp>
#include <boost/cors/decision.hpp>
#include <boost/cors/decorate.hpp>
#include <boost/cors/error.hpp>
#include <boost/cors/middleware.hpp>
#include <boost/cors/origin.hpp>
#include <boost/cors/origin_matcher.hpp>
#include <boost/cors/policy.hpp>
#include <boost/cors/preflight.hpp>
#include <boost/cors/token_set.hpp>

#endif
