//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#include "src/detail/timer_service.hpp"
#include "src/detail/resume_coro.hpp"

#include <boost/corocurl/detail/scheduler.hpp>
#include <boost/capy/error.hpp>

namespace boost::corocurl::detail {

timer_service::
timer_service(capy::execution_context&, scheduler& sched)
    : sched_(&sched)
{
}

timer_service::
~timer_service()
{
}

void
timer_service::
shutdown()
{
    for (auto* n : heap_)
        n->heap_index_ = timer_node::npos;
    heap_.clear();

    // Suspended waiters are abandoned along with their context
    while (auto* impl = impls_.pop_front())
        delete impl;
}

void
timer_service::
schedule(timer_node& n, time_point t)
{
    n.expiry_ = t;
    if (n.heap_index_ < heap_.size())
    {
        up_heap(n.heap_index_);
        down_heap(n.heap_index_);
        return;
    }

    n.heap_index_ = heap_.size();
    heap_.push_back(&n);
    up_heap(heap_.size() - 1);
}

void
timer_service::
cancel(timer_node& n) noexcept
{
    if (n.heap_index_ < heap_.size())
        remove(n.heap_index_);
}

std::size_t
timer_service::
process_expired()
{
    std::size_t n = 0;
    auto const now = clock_type::now();

    // The heap is re-read on every pass; on_expire may change it
    while (!heap_.empty() && heap_[0]->expiry_ <= now)
    {
        timer_node* node = heap_[0];
        remove(0);
        node->on_expire();
        ++n;
    }
    return n;
}

timer::timer_impl*
timer_service::
create_impl()
{
    auto* impl = new timer_wait_impl(*this);
    impls_.push_back(impl);
    return impl;
}

void
timer_service::
destroy_impl(timer_wait_impl& impl) noexcept
{
    cancel(impl);
    impls_.remove(&impl);
    delete &impl;
}

void
timer_service::
remove(std::size_t index) noexcept
{
    heap_[index]->heap_index_ = timer_node::npos;

    std::size_t last = heap_.size() - 1;
    if (index == last)
    {
        heap_.pop_back();
        return;
    }

    heap_[index] = heap_[last];
    heap_[index]->heap_index_ = index;
    heap_.pop_back();

    if (index > 0 &&
        heap_[index]->expiry_ < heap_[(index - 1) / 2]->expiry_)
        up_heap(index);
    else
        down_heap(index);
}

void
timer_service::
up_heap(std::size_t index) noexcept
{
    while (index > 0)
    {
        std::size_t parent = (index - 1) / 2;
        if (!(heap_[index]->expiry_ < heap_[parent]->expiry_))
            break;
        swap_heap(index, parent);
        index = parent;
    }
}

void
timer_service::
down_heap(std::size_t index) noexcept
{
    std::size_t child = index * 2 + 1;
    while (child < heap_.size())
    {
        std::size_t min_child = (child + 1 == heap_.size() ||
            heap_[child]->expiry_ < heap_[child + 1]->expiry_)
            ? child : child + 1;

        if (heap_[index]->expiry_ < heap_[min_child]->expiry_)
            break;

        swap_heap(index, min_child);
        index = min_child;
        child = index * 2 + 1;
    }
}

void
timer_service::
swap_heap(std::size_t i1, std::size_t i2) noexcept
{
    timer_node* tmp = heap_[i1];
    heap_[i1] = heap_[i2];
    heap_[i2] = tmp;
    heap_[i1]->heap_index_ = i1;
    heap_[i2]->heap_index_ = i2;
}

//------------------------------------------------------------------------------

void
timer_wait_impl::canceller::
operator()() const noexcept
{
    self->svc_.cancel(*self);
    self->cancel_wait();
}

void
timer_wait_impl::
release()
{
    cancel_wait();
    svc_.destroy_impl(*this);
}

void
timer_wait_impl::
wait(
    std::coroutine_handle<> h,
    capy::executor_ref ex,
    std::stop_token token,
    system::error_code* ec)
{
    if (token.stop_requested())
    {
        if (ec)
            *ec = capy::error::canceled;
        post_coro(ex, h);
        return;
    }

    // Expired or never set
    if (!scheduled())
    {
        if (ec)
            *ec = {};
        post_coro(ex, h);
        return;
    }

    h_ = h;
    ex_ = ex;
    ec_out_ = ec;
    waiting_ = true;
    svc_.get_scheduler().on_work_started();

    if (token.stop_possible())
        stop_cb_.emplace(token, canceller{this});
}

void
timer_wait_impl::
on_expire()
{
    if (!waiting_)
        return;
    waiting_ = false;
    stop_cb_.reset();

    if (ec_out_)
        *ec_out_ = {};

    // The resumed coroutine may destroy this impl
    auto& sched = svc_.get_scheduler();
    resume_coro(ex_, h_);
    sched.on_work_finished();
}

void
timer_wait_impl::
cancel_wait() noexcept
{
    if (!waiting_)
        return;
    waiting_ = false;
    stop_cb_.reset();

    if (ec_out_)
        *ec_out_ = capy::error::canceled;

    // Posting counts as work before the wait's unit is released
    post_coro(ex_, h_);
    svc_.get_scheduler().on_work_finished();
}

timer_service&
get_timer_service(capy::execution_context& ctx, scheduler& sched)
{
    return ctx.make_service<timer_service>(sched);
}

} // namespace boost::corocurl::detail
