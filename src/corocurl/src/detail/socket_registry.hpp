//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_SRC_DETAIL_SOCKET_REGISTRY_HPP
#define BOOST_COROCURL_SRC_DETAIL_SOCKET_REGISTRY_HPP

#include <boost/corocurl/detail/config.hpp>
#include <boost/corocurl/engine.hpp>

#include <cstddef>
#include <optional>
#include <unordered_map>

namespace boost::corocurl::detail {

class epoll_scheduler;
struct descriptor_watch;

/** Mirror of the descriptors an engine wants watched.

    Every entry corresponds to exactly one reactor subscription,
    delivered to a single receiver. Setting a descriptor again
    replaces its subscription; the reactor never holds more than
    one per descriptor.
*/
class socket_registry
{
public:
    socket_registry(
        epoll_scheduler& sched,
        descriptor_watch& w) noexcept;

    /// Withdraws every subscription.
    ~socket_registry();

    socket_registry(socket_registry const&) = delete;
    socket_registry& operator=(socket_registry const&) = delete;

    /** Watch a descriptor for exactly the given readiness.

        @param fd The descriptor.
        @param interest One of `want_read`, `want_write` or
            `want_both`. `remove` is equivalent to `clear(fd)`.

        @throws boost::system::system_error if the reactor
            refuses the descriptor. The descriptor is then not
            registered.
    */
    void set(native_handle_type fd, socket_interest interest);

    /** Stop watching a descriptor. Idempotent. */
    void clear(native_handle_type fd) noexcept;

    /** Stop watching every descriptor. */
    void clear_all() noexcept;

    std::size_t
    size() const noexcept
    {
        return entries_.size();
    }

    /** Return the watched readiness of a descriptor, if any. */
    std::optional<socket_interest>
    interest(native_handle_type fd) const noexcept;

private:
    epoll_scheduler& sched_;
    descriptor_watch& w_;
    std::unordered_map<native_handle_type, socket_interest> entries_;
};

} // namespace boost::corocurl::detail

#endif
