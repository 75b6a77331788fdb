//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_HPP
#define BOOST_COROCURL_HPP

#include <boost/corocurl/curl_engine.hpp>
#include <boost/corocurl/engine.hpp>
#include <boost/corocurl/error.hpp>
#include <boost/corocurl/io_context.hpp>
#include <boost/corocurl/multi.hpp>
#include <boost/corocurl/timer.hpp>
#include <boost/corocurl/transfer.hpp>
#include <boost/corocurl/version.hpp>

#endif
