//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_SRC_DETAIL_MAKE_ERR_HPP
#define BOOST_COROCURL_SRC_DETAIL_MAKE_ERR_HPP

#include <boost/corocurl/detail/config.hpp>
#include <boost/system/error_code.hpp>

namespace boost::corocurl::detail {

/** Convert a POSIX errno value to system::error_code.

    Maps ECANCELED to capy::error::canceled.

    @param errn The errno value.
    @return The corresponding system::error_code.
*/
system::error_code make_err(int errn) noexcept;

} // namespace boost::corocurl::detail

#endif
