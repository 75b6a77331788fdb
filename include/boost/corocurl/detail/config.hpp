//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_DETAIL_CONFIG_HPP
#define BOOST_COROCURL_DETAIL_CONFIG_HPP

#include <boost/config.hpp>

#if !defined(__linux__)
# error "Boost.Corocurl requires Linux (epoll)"
#endif

namespace boost {
namespace corocurl {

//------------------------------------------------

# if (defined(BOOST_COROCURL_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(BOOST_COROCURL_STATIC_LINK)
#  if defined(BOOST_COROCURL_SOURCE)
#   define BOOST_COROCURL_DECL        BOOST_SYMBOL_EXPORT
#   define BOOST_COROCURL_BUILD_DLL
#  else
#   define BOOST_COROCURL_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  BOOST_COROCURL_DECL
#  define BOOST_COROCURL_DECL
# endif

} // corocurl
} // boost

#endif
