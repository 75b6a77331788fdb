//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_IO_CONTEXT_HPP
#define BOOST_COROCURL_IO_CONTEXT_HPP

#include <boost/corocurl/detail/config.hpp>
#include <boost/corocurl/detail/scheduler.hpp>
#include <boost/capy/coro.hpp>
#include <boost/capy/ex/execution_context.hpp>

#include <chrono>
#include <coroutine>
#include <cstddef>
#include <limits>

namespace boost::corocurl {

/** A single-threaded I/O context driving transfers and timers.

    The io_context owns an epoll reactor, a timer heap and the
    services that connect transfer engines to them. Work is
    processed when `run()` (or one of its variants) is called
    on exactly one thread; every I/O object bound to the
    context must be used from that thread.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Unsafe, except for `stop()`.

    @par Example
    @code
    io_context ioc;
    multi m(ioc);
    capy::run_async(ioc.get_executor())(fetch_all(m));
    ioc.run();
    @endcode
*/
class BOOST_COROCURL_DECL io_context : public capy::execution_context
{
public:
    /** The executor type for this context. */
    class executor_type;

    /** Construct the context.

        Creates the epoll reactor and installs the timer and
        transfer services.

        @throws boost::system::system_error if the reactor
            cannot be created.
    */
    io_context();

    /** Destructor.

        Shuts down all services, abandoning suspended
        operations, then destroys them.
    */
    ~io_context();

    io_context(io_context const&) = delete;
    io_context& operator=(io_context const&) = delete;

    /** Return an executor for this context. */
    executor_type
    get_executor() const noexcept;

    /** Signal the context to stop processing.

        This causes `run()` to return as soon as possible. Any pending
        work items remain queued.
    */
    void
    stop()
    {
        sched_->stop();
    }

    /** Return whether the context has been stopped. */
    bool
    stopped() const noexcept
    {
        return sched_->stopped();
    }

    /** Restart the context after being stopped. */
    void
    restart()
    {
        sched_->restart();
    }

    /** Process work until none remains or `stop()` is called.

        Reactor callbacks (descriptor readiness, expired timers)
        count as executed handlers.

        @return The number of handlers executed.
    */
    std::size_t
    run()
    {
        return sched_->run();
    }

    /** Process at least one handler, blocking if necessary.

        @return The number of handlers executed.
    */
    std::size_t
    run_one()
    {
        return sched_->run_one();
    }

    /** Process work items for the specified duration.

        @return The number of handlers executed.
    */
    template<class Rep, class Period>
    std::size_t
    run_for(std::chrono::duration<Rep, Period> const& rel_time)
    {
        return run_until(std::chrono::steady_clock::now() + rel_time);
    }

    /** Process work items until the specified time.

        @return The number of handlers executed.
    */
    template<class Clock, class Duration>
    std::size_t
    run_until(std::chrono::time_point<Clock, Duration> const& abs_time)
    {
        std::size_t n = 0;
        for (;;)
        {
            std::size_t s = run_one_until(abs_time);
            if (s == 0)
                break;
            if (n <= (std::numeric_limits<std::size_t>::max)() - s)
                n += s;
        }
        return n;
    }

    /** Process handlers until at least one ran or the time is reached.

        @return The number of handlers executed.
    */
    template<class Clock, class Duration>
    std::size_t
    run_one_until(std::chrono::time_point<Clock, Duration> const& abs_time)
    {
        typename Clock::time_point now = Clock::now();
        while (now < abs_time)
        {
            auto rel_time = abs_time - now;
            if (rel_time > std::chrono::seconds(1))
                rel_time = std::chrono::seconds(1);

            std::size_t s = sched_->wait_one(
                static_cast<long>(std::chrono::duration_cast<
                    std::chrono::microseconds>(rel_time).count()));

            if (s || stopped())
                return s;

            now = Clock::now();
        }
        return 0;
    }

    /** Process all ready handlers without blocking.

        @return The number of handlers executed.
    */
    std::size_t
    poll()
    {
        return sched_->poll();
    }

    /** Process ready handlers without blocking, stopping after the first.

        @return The number of handlers executed.
    */
    std::size_t
    poll_one()
    {
        return sched_->poll_one();
    }

private:
    detail::scheduler* sched_ = nullptr;
};

//------------------------------------------------------------------------------

/** An executor for dispatching work to an io_context.

    Satisfies the `capy::Executor` concept. Two executors compare
    equal if they refer to the same context.
*/
class io_context::executor_type
{
    io_context* ctx_ = nullptr;

public:
    executor_type() = default;

    explicit
    executor_type(io_context& ctx) noexcept
        : ctx_(&ctx)
    {
    }

    io_context&
    context() const noexcept
    {
        return *ctx_;
    }

    bool
    running_in_this_thread() const noexcept
    {
        return ctx_->sched_->running_in_this_thread();
    }

    void
    on_work_started() const noexcept
    {
        ctx_->sched_->on_work_started();
    }

    void
    on_work_finished() const noexcept
    {
        ctx_->sched_->on_work_finished();
    }

    /** Dispatch a coroutine handle.

        If called from within `run()`, returns the handle for
        symmetric transfer. Otherwise posts the handle and returns
        `noop_coroutine`.
    */
    capy::coro
    dispatch(capy::coro h) const
    {
        if (running_in_this_thread())
            return h;
        ctx_->sched_->post(h);
        return std::noop_coroutine();
    }

    /** Post a coroutine for deferred execution. */
    void
    post(capy::coro h) const
    {
        ctx_->sched_->post(h);
    }

    bool
    operator==(executor_type const& other) const noexcept
    {
        return ctx_ == other.ctx_;
    }

    bool
    operator!=(executor_type const& other) const noexcept
    {
        return ctx_ != other.ctx_;
    }
};

//------------------------------------------------------------------------------

inline
io_context::executor_type
io_context::
get_executor() const noexcept
{
    return executor_type(const_cast<io_context&>(*this));
}

} // namespace boost::corocurl

#endif
