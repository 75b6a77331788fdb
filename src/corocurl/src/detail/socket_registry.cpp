//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#include "src/detail/socket_registry.hpp"
#include "src/detail/epoll/scheduler.hpp"

#include <sys/epoll.h>

namespace boost::corocurl::detail {

namespace {

std::uint32_t
to_events(socket_interest interest) noexcept
{
    switch (interest)
    {
    case socket_interest::want_read:
        return EPOLLIN;
    case socket_interest::want_write:
        return EPOLLOUT;
    case socket_interest::want_both:
        return EPOLLIN | EPOLLOUT;
    case socket_interest::remove:
        break;
    }
    return 0;
}

} // namespace

socket_registry::
socket_registry(
    epoll_scheduler& sched,
    descriptor_watch& w) noexcept
    : sched_(sched)
    , w_(w)
{
}

socket_registry::
~socket_registry()
{
    clear_all();
}

void
socket_registry::
set(native_handle_type fd, socket_interest interest)
{
    if (interest == socket_interest::remove)
    {
        clear(fd);
        return;
    }

    auto it = entries_.find(fd);
    if (it != entries_.end() && it->second == interest)
        return;

    try
    {
        // Replaces any earlier subscription for fd in one step
        sched_.watch(fd, &w_, to_events(interest));
    }
    catch (...)
    {
        if (it != entries_.end())
        {
            entries_.erase(it);
            sched_.unwatch(fd);
        }
        throw;
    }

    entries_[fd] = interest;
}

void
socket_registry::
clear(native_handle_type fd) noexcept
{
    auto it = entries_.find(fd);
    if (it == entries_.end())
        return;
    entries_.erase(it);
    sched_.unwatch(fd);
}

void
socket_registry::
clear_all() noexcept
{
    for (auto const& [fd, interest] : entries_)
        sched_.unwatch(fd);
    entries_.clear();
}

std::optional<socket_interest>
socket_registry::
interest(native_handle_type fd) const noexcept
{
    auto it = entries_.find(fd);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

} // namespace boost::corocurl::detail
