//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_SRC_DETAIL_TIMER_LINE_HPP
#define BOOST_COROCURL_SRC_DETAIL_TIMER_LINE_HPP

#include <boost/corocurl/detail/config.hpp>

#include "src/detail/timer_service.hpp"

#include <chrono>

namespace boost::corocurl::detail {

/** A single replaceable deadline.

    Arming replaces any earlier deadline, so at most one is ever
    outstanding and a replaced deadline can no longer fire. The
    handler runs after the deadline has left the timer heap, so
    it may re-arm.
*/
class timer_line
    : private timer_node
{
public:
    using clock_type = std::chrono::steady_clock;
    using time_point = clock_type::time_point;
    using duration = clock_type::duration;

    // Context + function pointer, invoked on expiry
    class handler
    {
        void* ctx_ = nullptr;
        void(*fn_)(void*) = nullptr;

    public:
        handler() = default;
        handler(void* ctx, void(*fn)(void*)) noexcept
            : ctx_(ctx), fn_(fn) {}

        void operator()() const { if (fn_) fn_(ctx_); }
    };

    timer_line(timer_service& svc, handler h) noexcept
        : svc_(svc)
        , h_(h)
    {
    }

    ~timer_line()
    {
        disarm();
    }

    timer_line(timer_line const&) = delete;
    timer_line& operator=(timer_line const&) = delete;

    /// Fire after `d`; zero fires on the next reactor turn.
    void arm(duration d)
    {
        svc_.schedule(*this, clock_type::now() + d);
    }

    /// Idempotent.
    void disarm() noexcept
    {
        svc_.cancel(*this);
    }

    bool armed() const noexcept
    {
        return scheduled();
    }

    /// The last armed deadline.
    time_point expiry() const noexcept
    {
        return timer_node::expiry();
    }

private:
    void on_expire() override
    {
        h_();
    }

    timer_service& svc_;
    handler h_;
};

} // namespace boost::corocurl::detail

#endif
