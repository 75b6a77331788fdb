//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_SRC_DETAIL_TIMER_SERVICE_HPP
#define BOOST_COROCURL_SRC_DETAIL_TIMER_SERVICE_HPP

#include <boost/corocurl/timer.hpp>
#include <boost/capy/coro.hpp>
#include <boost/capy/ex/executor_ref.hpp>
#include <boost/capy/ex/execution_context.hpp>
#include <boost/system/error_code.hpp>

#include "src/detail/intrusive.hpp"

#include <chrono>
#include <cstddef>
#include <limits>
#include <optional>
#include <stop_token>
#include <vector>

namespace boost::corocurl::detail {

struct scheduler;
class timer_service;
struct timer_wait_impl;

/** An entry in the timer heap.

    Derived classes receive `on_expire()` when their deadline
    passes. A node is in the heap from `schedule()` until it
    expires or is cancelled.
*/
class timer_node
{
    friend class timer_service;

    static constexpr std::size_t npos =
        (std::numeric_limits<std::size_t>::max)();

    std::chrono::steady_clock::time_point expiry_{};
    std::size_t heap_index_ = npos;

public:
    /** Return true if the node is in the heap. */
    bool
    scheduled() const noexcept
    {
        return heap_index_ != npos;
    }

    /** Return the time the node was last scheduled for. */
    std::chrono::steady_clock::time_point
    expiry() const noexcept
    {
        return expiry_;
    }

    /** Called by the service after the node leaves the heap. */
    virtual void on_expire() = 0;

protected:
    ~timer_node() = default;
};

//------------------------------------------------------------------------------

/** Binary min-heap of deadlines driven by the scheduler.

    The scheduler bounds its reactor wait by `nearest_expiry()`
    and calls `process_expired()` after each wait.
*/
class timer_service : public capy::execution_context::service
{
public:
    using clock_type = std::chrono::steady_clock;
    using time_point = clock_type::time_point;
    using key_type = timer_service;

    timer_service(capy::execution_context& ctx, scheduler& sched);
    ~timer_service();

    timer_service(timer_service const&) = delete;
    timer_service& operator=(timer_service const&) = delete;

    scheduler& get_scheduler() const noexcept { return *sched_; }

    /** Insert a node, or move it if already scheduled. */
    void schedule(timer_node& n, time_point t);

    /** Remove a node from the heap. Idempotent. */
    void cancel(timer_node& n) noexcept;

    bool empty() const noexcept { return heap_.empty(); }

    time_point nearest_expiry() const noexcept
    {
        return heap_.empty() ? time_point::max() : heap_[0]->expiry_;
    }

    /** Fire every node whose deadline has passed.

        Nodes are removed and fired one at a time, so a callback
        may schedule or cancel any node, including itself.

        @return The number of nodes fired.
    */
    std::size_t process_expired();

    void shutdown() override;

    timer::timer_impl* create_impl();
    void destroy_impl(timer_wait_impl& impl) noexcept;

private:
    void remove(std::size_t index) noexcept;
    void up_heap(std::size_t index) noexcept;
    void down_heap(std::size_t index) noexcept;
    void swap_heap(std::size_t i1, std::size_t i2) noexcept;

    scheduler* sched_;
    std::vector<timer_node*> heap_;
    intrusive_list<timer_wait_impl> impls_;
};

//------------------------------------------------------------------------------

/** Implementation of the public timer. */
struct timer_wait_impl
    : timer::timer_impl
    , timer_node
    , intrusive_list<timer_wait_impl>::node
{
    struct canceller
    {
        timer_wait_impl* self;
        void operator()() const noexcept;
    };

    timer_service& svc_;
    capy::coro h_;
    capy::executor_ref ex_;
    system::error_code* ec_out_ = nullptr;
    bool waiting_ = false;
    std::optional<std::stop_callback<canceller>> stop_cb_;

    explicit timer_wait_impl(timer_service& svc) noexcept
        : svc_(svc)
    {
    }

    void release() override;

    void wait(
        std::coroutine_handle<>,
        capy::executor_ref,
        std::stop_token,
        system::error_code*) override;

    void on_expire() override;

    // Complete a pending wait with capy::error::canceled
    void cancel_wait() noexcept;
};

/** Return the timer service of a context, creating it if needed. */
timer_service&
get_timer_service(capy::execution_context& ctx, scheduler& sched);

} // namespace boost::corocurl::detail

#endif
