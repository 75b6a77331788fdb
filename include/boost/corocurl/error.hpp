//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_ERROR_HPP
#define BOOST_COROCURL_ERROR_HPP

#include <boost/corocurl/detail/config.hpp>
#include <boost/system/error_code.hpp>

namespace boost::corocurl {

/** Error codes reported by transfer coordination.

    Failures reported by the transfer engine itself use the
    engine's own category; see @ref curl_category and
    @ref curl_multi_category.
*/
enum class error
{
    /// The engine refused to register the transfer.
    engine_rejected = 1,

    /// The transfer is not registered with the coordinator.
    not_registered,

    /// The operation already produced its result.
    already_completed,

    /// The transfer was stopped before it completed.
    stopped,

    /// The transfer is already being performed.
    already_registered,

    /// The option is owned by the event loop and cannot be set.
    reserved_option,

    /// The event loop could not subscribe to a descriptor.
    subscription_failed
};

/** Return the category of @ref error values. */
BOOST_COROCURL_DECL
system::error_category const&
get_error_category() noexcept;

/** Return the category wrapping libcurl `CURLcode` values. */
BOOST_COROCURL_DECL
system::error_category const&
curl_category() noexcept;

/** Return the category wrapping libcurl `CURLMcode` values. */
BOOST_COROCURL_DECL
system::error_category const&
curl_multi_category() noexcept;

inline
system::error_code
make_error_code(error e) noexcept
{
    return system::error_code(static_cast<int>(e), get_error_category());
}

} // namespace boost::corocurl

namespace boost::system {

template<>
struct is_error_code_enum<::boost::corocurl::error>
{
    static bool const value = true;
};

} // namespace boost::system

#endif
