//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_DETAIL_EXCEPT_HPP
#define BOOST_COROCURL_DETAIL_EXCEPT_HPP

#include <boost/corocurl/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>

namespace boost::corocurl::detail {

/** Report misuse of an object.

    Thrown for a null engine, a reconfigured registered
    transfer, or objects moved across execution contexts.

    @throws std::logic_error always.
*/
BOOST_COROCURL_DECL BOOST_NORETURN void
throw_logic_error(
    char const* what,
    source_location const& loc = BOOST_CURRENT_LOCATION);

/** Report a failed reactor or libcurl call.

    @param ec The failure. Must be set.
    @param what The call that failed, for example `"epoll_ctl"`.

    @throws system::system_error always.
*/
BOOST_COROCURL_DECL BOOST_NORETURN void
throw_system_error(
    system::error_code const& ec,
    char const* what,
    source_location const& loc = BOOST_CURRENT_LOCATION);

} // namespace boost::corocurl::detail

#endif
