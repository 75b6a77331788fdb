//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#include <boost/corocurl/timer.hpp>
#include <boost/corocurl/detail/except.hpp>

#include "src/detail/timer_service.hpp"

namespace boost::corocurl {

namespace {

detail::timer_wait_impl&
get_impl(io_object::io_object_impl* p) noexcept
{
    return *static_cast<detail::timer_wait_impl*>(
        static_cast<timer::timer_impl*>(p));
}

} // namespace

timer::
~timer()
{
    if (impl_)
        impl_->release();
}

timer::
timer(capy::execution_context& ctx)
    : io_object(ctx)
{
    auto* svc = ctx.find_service<detail::timer_service>();
    if (!svc)
        detail::throw_logic_error("timer: context has no timer service");
    impl_ = svc->create_impl();
}

timer::
timer(timer&& other) noexcept
    : io_object(std::move(other))
{
    impl_ = other.impl_;
    other.impl_ = nullptr;
}

timer&
timer::
operator=(timer&& other)
{
    if (this != &other)
    {
        if (ctx_ != other.ctx_)
            detail::throw_logic_error("timer::operator=: context mismatch");

        if (impl_)
            impl_->release();

        impl_ = other.impl_;
        other.impl_ = nullptr;
    }
    return *this;
}

void
timer::
cancel()
{
    auto& impl = get_impl(impl_);
    impl.svc_.cancel(impl);
    impl.cancel_wait();
}

timer::time_point
timer::
expiry() const
{
    return get_impl(impl_).expiry();
}

void
timer::
expires_at(time_point t)
{
    auto& impl = get_impl(impl_);
    impl.cancel_wait();
    impl.svc_.schedule(impl, t);
}

void
timer::
expires_after(duration d)
{
    expires_at(clock_type::now() + d);
}

} // namespace boost::corocurl
