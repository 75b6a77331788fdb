//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_TIMER_HPP
#define BOOST_COROCURL_TIMER_HPP

#include <boost/corocurl/detail/config.hpp>
#include <boost/corocurl/io_object.hpp>
#include <boost/capy/error.hpp>
#include <boost/capy/io_result.hpp>
#include <boost/capy/ex/executor_ref.hpp>
#include <boost/capy/ex/execution_context.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <coroutine>
#include <stop_token>

namespace boost::corocurl {

/** An asynchronous deadline timer.

    Transfers carry no timeout of their own; a caller that wants
    one races a timer against the transfer and requests a stop
    when the timer fires.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Unsafe.

    @par Example
    @code
    timer t(ioc);
    t.expires_after(std::chrono::seconds(5));
    auto [ec] = co_await t.wait();
    if (!ec)
        stop_src.request_stop();
    @endcode
*/
class BOOST_COROCURL_DECL timer : public io_object
{
    struct wait_awaitable
    {
        timer& t_;
        std::stop_token token_;
        mutable system::error_code ec_;

        explicit wait_awaitable(timer& t) noexcept : t_(t) {}

        bool await_ready() const noexcept
        {
            return token_.stop_requested();
        }

        capy::io_result<> await_resume() const noexcept
        {
            if (token_.stop_requested())
                return {capy::error::canceled};
            return {ec_};
        }

        template<typename Ex>
        auto await_suspend(
            std::coroutine_handle<> h,
            Ex const& ex,
            std::stop_token token) -> std::coroutine_handle<>
        {
            token_ = std::move(token);
            t_.get().wait(h, ex, token_, &ec_);
            return std::noop_coroutine();
        }
    };

public:
    struct timer_impl : io_object_impl
    {
        virtual void wait(
            std::coroutine_handle<>,
            capy::executor_ref,
            std::stop_token,
            system::error_code*) = 0;
    };

    using clock_type = std::chrono::steady_clock;
    using time_point = clock_type::time_point;
    using duration = clock_type::duration;

    /** Destructor.

        Cancels any pending wait.
    */
    ~timer();

    /** Construct a timer bound to a context.

        The expiry is initially `time_point{}`.
    */
    explicit timer(capy::execution_context& ctx);

    /** Move constructor. */
    timer(timer&& other) noexcept;

    /** Move assignment.

        @throws std::logic_error if the timers belong to
            different execution contexts.
    */
    timer& operator=(timer&& other);

    timer(timer const&) = delete;
    timer& operator=(timer const&) = delete;

    /** Cancel a pending wait.

        The waiter completes with `capy::error::canceled`.
        Has no effect if no wait is pending.
    */
    void cancel();

    /** Return the current expiry. */
    time_point expiry() const;

    /** Set an absolute expiry, cancelling any pending wait. */
    void expires_at(time_point t);

    /** Set an expiry relative to now, cancelling any pending wait. */
    void expires_after(duration d);

    /** Wait for the timer to expire.

        Completes with success at the expiry, immediately if the
        expiry is already in the past, or with
        `capy::error::canceled` if the wait is cancelled by
        `cancel()`, by a new expiry, or by the stop token.
    */
    auto wait()
    {
        return wait_awaitable(*this);
    }

private:
    timer_impl& get() const noexcept
    {
        return *static_cast<timer_impl*>(impl_);
    }
};

} // namespace boost::corocurl

#endif
