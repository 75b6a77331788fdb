//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_SRC_DETAIL_EPOLL_SCHEDULER_HPP
#define BOOST_COROCURL_SRC_DETAIL_EPOLL_SCHEDULER_HPP

#include <boost/corocurl/detail/config.hpp>
#include <boost/corocurl/detail/scheduler.hpp>
#include <boost/capy/ex/execution_context.hpp>

#include "src/detail/scheduler_op.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <unordered_map>

namespace boost::corocurl::detail {

class timer_service;

/** Receiver of descriptor readiness notifications.

    The reactor looks up the watch for a descriptor when the
    event is delivered, so a watch removed or replaced earlier
    in the same reactor pass never sees the event.
*/
struct descriptor_watch
{
    /** Called when `fd` is ready.

        @param fd The descriptor.
        @param events The epoll events, masked to the
            subscribed interest plus EPOLLERR and EPOLLHUP.
    */
    virtual void on_descriptor_ready(int fd, std::uint32_t events) = 0;

protected:
    ~descriptor_watch() = default;
};

/** Single-threaded Linux scheduler using epoll.

    One thread calls `run()`. Each turn executes a queued handler
    if one is available; otherwise the thread waits in epoll_wait
    for the nearest of descriptor readiness, timer expiry, or an
    interrupt from `stop()`. Readiness and timer callbacks run
    inline on the reactor turn.

    Descriptor subscriptions are level-triggered and persist until
    replaced or withdrawn; this is the semantics transfer engines
    expect from their host loop.
*/
class epoll_scheduler
    : public scheduler
    , public capy::execution_context::service
{
public:
    using key_type = scheduler;

    explicit epoll_scheduler(capy::execution_context& ctx);
    ~epoll_scheduler();

    epoll_scheduler(epoll_scheduler const&) = delete;
    epoll_scheduler& operator=(epoll_scheduler const&) = delete;

    void shutdown() override;
    void post(capy::coro h) const override;
    void post(scheduler_op* h) const override;
    void on_work_started() noexcept override;
    void on_work_finished() noexcept override;
    bool running_in_this_thread() const noexcept override;
    void stop() override;
    bool stopped() const noexcept override;
    void restart() override;
    std::size_t run() override;
    std::size_t run_one() override;
    std::size_t wait_one(long usec) override;
    std::size_t poll() override;
    std::size_t poll_one() override;

    /** Subscribe to readiness of a descriptor.

        Installs a subscription for `fd`, or replaces the existing
        one. After this returns, only `w` receives notifications
        for `fd`, and only for `events`.

        @param fd The descriptor to watch.
        @param w The receiver of notifications.
        @param events EPOLLIN, EPOLLOUT or both.

        @throws boost::system::system_error if epoll refuses
            the descriptor.
    */
    void watch(int fd, descriptor_watch* w, std::uint32_t events);

    /** Withdraw the subscription for a descriptor.

        Has no effect if the descriptor is not watched.
    */
    void unwatch(int fd) noexcept;

    /** Return true if `fd` currently has a subscription. */
    bool watching(int fd) const noexcept;

    /** Return the timer service driven by this scheduler. */
    timer_service& timers() const noexcept { return *timer_svc_; }

private:
    struct watch_entry
    {
        descriptor_watch* w;
        std::uint32_t events;
    };

    std::size_t do_one(long timeout_us);
    std::size_t run_reactor(long timeout_us);
    void interrupt_reactor() const;
    long calculate_timeout(long requested_timeout_us) const;

    int epoll_fd_;
    int event_fd_;                              // for interrupting reactor
    mutable op_queue completed_ops_;
    mutable long outstanding_work_;
    std::atomic<bool> stopped_;
    bool shutdown_;
    timer_service* timer_svc_ = nullptr;
    std::unordered_map<int, watch_entry> watches_;
};

} // namespace boost::corocurl::detail

#endif
