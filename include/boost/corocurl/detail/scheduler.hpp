//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_DETAIL_SCHEDULER_HPP
#define BOOST_COROCURL_DETAIL_SCHEDULER_HPP

#include <boost/corocurl/detail/config.hpp>
#include <boost/capy/coro.hpp>

#include <cstddef>

namespace boost::corocurl::detail {

class scheduler_op;

/** The event loop behind an io_context.

    One thread runs the loop. Handlers, descriptor readiness
    and deadlines are all delivered on that thread, so the
    transfer coordinators need no locking. Only `stop()` may
    be called from another thread.
*/
struct scheduler
{
    virtual ~scheduler() = default;

    // Queue a coroutine or handler for the next turn
    virtual void post(capy::coro) const = 0;
    virtual void post(scheduler_op*) const = 0;
    virtual bool running_in_this_thread() const noexcept = 0;

    /** Outstanding work keeps run() from returning.

        A suspended perform or timer wait counts as one unit.
        Descriptor subscriptions and coordinator deadlines do
        not. When the count drops to zero the loop stops.
    */
    virtual void on_work_started() noexcept = 0;
    virtual void on_work_finished() noexcept = 0;

    virtual void stop() = 0;
    virtual bool stopped() const noexcept = 0;
    virtual void restart() = 0;

    virtual std::size_t run() = 0;
    virtual std::size_t run_one() = 0;

    /// Run at most one handler, waiting up to `usec` microseconds.
    virtual std::size_t wait_one(long usec) = 0;

    virtual std::size_t poll() = 0;
    virtual std::size_t poll_one() = 0;
};

} // namespace boost::corocurl::detail

#endif
