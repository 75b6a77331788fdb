//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_VERSION_HPP
#define BOOST_COROCURL_VERSION_HPP

/** The library version as `major * 100000 + minor * 100 + patch`. */
#define BOOST_COROCURL_VERSION 100

#define BOOST_COROCURL_VERSION_STRING "0.1.0"

#endif
