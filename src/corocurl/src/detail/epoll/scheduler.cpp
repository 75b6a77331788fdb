//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#include "src/detail/epoll/scheduler.hpp"
#include "src/detail/make_err.hpp"
#include "src/detail/multi_service.hpp"
#include "src/detail/timer_service.hpp"

#include <boost/corocurl/detail/except.hpp>

#include <algorithm>
#include <chrono>
#include <limits>
#include <memory>

#include <errno.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

/*
    epoll Scheduler - Single Thread Model
    =====================================

    Event Loop Structure (do_one)
    -----------------------------
    1. Pop a handler from the queue; if there is one, execute it
    2. If no outstanding work remains, stop and return
    3. Otherwise run the reactor: epoll_wait with a timeout bounded
       by the nearest timer, then deliver readiness callbacks, then
       fire expired timers

    Readiness Delivery
    ------------------
    The epoll user data is the descriptor itself, not a pointer to a
    subscription object. Each event is looked up in watches_ at the
    moment it is delivered. A callback that withdraws or replaces a
    different descriptor's subscription therefore cannot cause a
    dangling access or a notification for an interest that no
    longer exists; events are masked with the current interest.

    Work Counting
    -------------
    outstanding_work_ tracks suspended operations and queued handlers.
    When it reaches zero, run() returns. Descriptor and timer
    subscriptions are not work by themselves: they exist on behalf
    of operations that hold work.
*/

namespace boost::corocurl::detail {

namespace {

thread_local epoll_scheduler const* current_scheduler = nullptr;

struct thread_context_guard
{
    epoll_scheduler const* prev_;

    explicit thread_context_guard(
        epoll_scheduler const* ctx) noexcept
        : prev_(current_scheduler)
    {
        current_scheduler = ctx;
    }

    ~thread_context_guard() noexcept
    {
        current_scheduler = prev_;
    }
};

} // namespace

epoll_scheduler::
epoll_scheduler(capy::execution_context& ctx)
    : epoll_fd_(-1)
    , event_fd_(-1)
    , outstanding_work_(0)
    , stopped_(false)
    , shutdown_(false)
{
    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0)
        detail::throw_system_error(make_err(errno), "epoll_create1");

    event_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (event_fd_ < 0)
    {
        int errn = errno;
        ::close(epoll_fd_);
        detail::throw_system_error(make_err(errn), "eventfd");
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = event_fd_;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, event_fd_, &ev) < 0)
    {
        int errn = errno;
        ::close(event_fd_);
        ::close(epoll_fd_);
        detail::throw_system_error(make_err(errn), "epoll_ctl");
    }

    timer_svc_ = &get_timer_service(ctx, *this);

    // Transfer coordinators register descriptors and deadlines here
    get_multi_service(ctx, *this);
}

epoll_scheduler::
~epoll_scheduler()
{
    if (event_fd_ >= 0)
        ::close(event_fd_);
    if (epoll_fd_ >= 0)
        ::close(epoll_fd_);
}

void
epoll_scheduler::
shutdown()
{
    shutdown_ = true;

    while (auto* h = completed_ops_.pop())
        h->destroy();

    for (auto const& [fd, entry] : watches_)
        ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    watches_.clear();

    outstanding_work_ = 0;
}

void
epoll_scheduler::
post(capy::coro h) const
{
    struct post_handler final
        : scheduler_op
    {
        capy::coro h_;

        explicit
        post_handler(capy::coro h)
            : h_(h)
        {
        }

        ~post_handler() = default;

        void operator()() override
        {
            auto h = h_;
            delete this;
            h.resume();
        }

        void destroy() override
        {
            delete this;
        }
    };

    auto ph = std::make_unique<post_handler>(h);
    post(ph.release());
}

void
epoll_scheduler::
post(scheduler_op* h) const
{
    if (shutdown_)
    {
        h->destroy();
        return;
    }

    ++outstanding_work_;
    completed_ops_.push(h);
}

void
epoll_scheduler::
on_work_started() noexcept
{
    ++outstanding_work_;
}

void
epoll_scheduler::
on_work_finished() noexcept
{
    if (outstanding_work_ > 0 && --outstanding_work_ == 0)
        stop();
}

bool
epoll_scheduler::
running_in_this_thread() const noexcept
{
    return current_scheduler == this;
}

void
epoll_scheduler::
stop()
{
    bool expected = false;
    if (stopped_.compare_exchange_strong(expected, true,
            std::memory_order_release, std::memory_order_relaxed))
        interrupt_reactor();
}

bool
epoll_scheduler::
stopped() const noexcept
{
    return stopped_.load(std::memory_order_acquire);
}

void
epoll_scheduler::
restart()
{
    stopped_.store(false, std::memory_order_release);
}

std::size_t
epoll_scheduler::
run()
{
    if (stopped())
        return 0;

    if (outstanding_work_ == 0)
    {
        stop();
        return 0;
    }

    thread_context_guard ctx(this);

    std::size_t n = 0;
    for (;;)
    {
        std::size_t s = do_one(-1);
        if (s == 0)
            break;
        if (n <= (std::numeric_limits<std::size_t>::max)() - s)
            n += s;
    }
    return n;
}

std::size_t
epoll_scheduler::
run_one()
{
    if (stopped())
        return 0;

    if (outstanding_work_ == 0)
    {
        stop();
        return 0;
    }

    thread_context_guard ctx(this);
    return do_one(-1);
}

std::size_t
epoll_scheduler::
wait_one(long usec)
{
    if (stopped())
        return 0;

    if (outstanding_work_ == 0)
    {
        stop();
        return 0;
    }

    thread_context_guard ctx(this);
    return do_one(usec);
}

std::size_t
epoll_scheduler::
poll()
{
    if (stopped())
        return 0;

    if (outstanding_work_ == 0)
    {
        stop();
        return 0;
    }

    thread_context_guard ctx(this);

    std::size_t n = 0;
    for (;;)
    {
        std::size_t s = do_one(0);
        if (s == 0)
            break;
        if (n <= (std::numeric_limits<std::size_t>::max)() - s)
            n += s;
    }
    return n;
}

std::size_t
epoll_scheduler::
poll_one()
{
    if (stopped())
        return 0;

    if (outstanding_work_ == 0)
    {
        stop();
        return 0;
    }

    thread_context_guard ctx(this);
    return do_one(0);
}

void
epoll_scheduler::
watch(int fd, descriptor_watch* w, std::uint32_t events)
{
    epoll_event ev{};
    ev.events = events;
    ev.data.fd = fd;

    auto it = watches_.find(fd);
    int op = (it == watches_.end()) ? EPOLL_CTL_ADD : EPOLL_CTL_MOD;
    if (::epoll_ctl(epoll_fd_, op, fd, &ev) < 0)
    {
        // The descriptor number may have been closed and reused
        // behind our back, which leaves the epoll set out of step
        // with watches_ in either direction.
        int errn = errno;
        if (op == EPOLL_CTL_MOD && errn == ENOENT)
            op = EPOLL_CTL_ADD;
        else if (op == EPOLL_CTL_ADD && errn == EEXIST)
            op = EPOLL_CTL_MOD;
        else
            detail::throw_system_error(make_err(errn), "epoll_ctl");

        if (::epoll_ctl(epoll_fd_, op, fd, &ev) < 0)
            detail::throw_system_error(make_err(errno), "epoll_ctl");
    }

    watches_[fd] = watch_entry{w, events};
}

void
epoll_scheduler::
unwatch(int fd) noexcept
{
    auto it = watches_.find(fd);
    if (it == watches_.end())
        return;
    watches_.erase(it);

    // Fails with EBADF if the descriptor was already closed,
    // in which case the kernel already dropped it from the set.
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
}

bool
epoll_scheduler::
watching(int fd) const noexcept
{
    return watches_.find(fd) != watches_.end();
}

void
epoll_scheduler::
interrupt_reactor() const
{
    std::uint64_t val = 1;
    [[maybe_unused]] auto r = ::write(event_fd_, &val, sizeof(val));
}

struct work_guard
{
    epoll_scheduler* self;
    ~work_guard() { self->on_work_finished(); }
};

long
epoll_scheduler::
calculate_timeout(long requested_timeout_us) const
{
    if (requested_timeout_us == 0)
        return 0;

    auto nearest = timer_svc_->nearest_expiry();
    if (nearest == timer_service::time_point::max())
        return requested_timeout_us;

    auto now = std::chrono::steady_clock::now();
    if (nearest <= now)
        return 0;

    auto timer_timeout_us = std::chrono::duration_cast<std::chrono::microseconds>(
        nearest - now).count();

    if (requested_timeout_us < 0)
        return static_cast<long>(timer_timeout_us);

    return static_cast<long>((std::min)(
        static_cast<long long>(requested_timeout_us),
        static_cast<long long>(timer_timeout_us)));
}

std::size_t
epoll_scheduler::
run_reactor(long timeout_us)
{
    long effective_timeout_us = calculate_timeout(timeout_us);

    int timeout_ms;
    if (effective_timeout_us < 0)
        timeout_ms = -1;
    else if (effective_timeout_us == 0)
        timeout_ms = 0;
    else
        timeout_ms = static_cast<int>((effective_timeout_us + 999) / 1000);

    epoll_event events[64];
    int nfds = ::epoll_wait(epoll_fd_, events, 64, timeout_ms);
    if (nfds < 0)
    {
        if (errno != EINTR)
            detail::throw_system_error(make_err(errno), "epoll_wait");
        nfds = 0;
    }

    std::size_t n = 0;
    for (int i = 0; i < nfds; ++i)
    {
        int fd = events[i].data.fd;
        if (fd == event_fd_)
        {
            std::uint64_t val;
            [[maybe_unused]] auto r = ::read(event_fd_, &val, sizeof(val));
            continue;
        }

        // Withdrawn by an earlier callback in this pass
        auto it = watches_.find(fd);
        if (it == watches_.end())
            continue;

        std::uint32_t ready = events[i].events &
            (it->second.events | EPOLLERR | EPOLLHUP);
        if (ready == 0)
            continue;

        it->second.w->on_descriptor_ready(fd, ready);
        ++n;

        if (stopped())
            return n;
    }

    n += timer_svc_->process_expired();
    return n;
}

std::size_t
epoll_scheduler::
do_one(long timeout_us)
{
    using clock = std::chrono::steady_clock;
    auto deadline = (timeout_us > 0)
        ? clock::now() + std::chrono::microseconds(timeout_us)
        : clock::time_point{};

    for (;;)
    {
        if (stopped())
            return 0;

        if (scheduler_op* op = completed_ops_.pop())
        {
            work_guard g{this};
            (*op)();
            return 1;
        }

        if (outstanding_work_ == 0)
        {
            stop();
            return 0;
        }

        long remaining_us = timeout_us;
        if (timeout_us > 0)
        {
            auto now = clock::now();
            if (now >= deadline)
                return 0;
            remaining_us = static_cast<long>(
                std::chrono::duration_cast<std::chrono::microseconds>(
                    deadline - now).count());
        }

        std::size_t n = run_reactor(remaining_us);
        if (n > 0)
            return n;

        if (timeout_us == 0 && completed_ops_.empty())
            return 0;
    }
}

} // namespace boost::corocurl::detail
