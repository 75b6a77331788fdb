//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#include "src/detail/multi_service.hpp"
#include "src/detail/resume_coro.hpp"

#include <boost/corocurl/error.hpp>
#include <boost/corocurl/version.hpp>
#include <boost/capy/error.hpp>
#include <boost/system/system_error.hpp>

#include <flow/common.hpp>

#include <sys/epoll.h>

#include <utility>
#include <vector>

namespace boost::corocurl::detail {

multi_impl::
multi_impl(
    multi_service& svc,
    std::unique_ptr<engine> e,
    flow::log::Logger* logger)
    : flow::log::Log_context(logger, flow::Flow_log_component::S_UNCAT)
    , svc_(svc)
    , sched_(svc.get_scheduler())
    , engine_(std::move(e))
    , sockets_(sched_, *this)
    , deadline_(sched_.timers(), timer_line::handler(this, &on_deadline))
{
    engine_->set_socket_callback(socket_callback(this, &on_socket_callback));
    engine_->set_timer_callback(timer_callback(this, &on_timer_callback));
}

multi_impl::
~multi_impl()
{
    // The engine may report withdrawn sockets while it is destroyed
    engine_.reset();
}

void
multi_impl::
release()
{
    shutdown();
    svc_.destroy_impl(*this);
}

//------------------------------------------------------------------------------

bool
multi_impl::
perform(
    transfer& t,
    std::coroutine_handle<> h,
    capy::executor_ref ex,
    std::stop_token token,
    system::error_code* ec,
    transfer_outcome* out)
{
    if (t.registered())
    {
        *ec = error::already_registered;
        return false;
    }

    if (token.stop_requested())
    {
        *ec = capy::error::canceled;
        return false;
    }

    system::error_code aec;
    auto tok = add(t, aec);
    if (aec)
    {
        *ec = aec;
        return false;
    }

    // Resolved while registering; the transfer records how
    auto it = transfers_.find(tok);
    if (it == transfers_.end())
    {
        if (t.state() == transfer_state::failed)
            *ec = t.error();
        else
            *ec = error::stopped;
        return false;
    }

    auto& reg = *it->second;
    reg.h = h;
    reg.ex = ex;
    reg.ec_out = ec;
    reg.out = out;
    reg.waiting = true;

    // Held until the resumption is posted
    sched_.on_work_started();

    if (token.stop_possible())
        reg.stop_cb.emplace(std::move(token), canceller{this, tok});
    return true;
}

transfer_token
multi_impl::
add(transfer& t, system::error_code& ec)
{
    auto tok = next_token_++;

    auto reg = std::make_unique<registration>();
    reg->t = &t;
    transfers_.emplace(tok, std::move(reg));

    t.token_ = tok;
    t.state_ = transfer_state::registered;
    t.owner_ = this;

    FLOW_LOG_TRACE("multi [" << this << "]: register transfer token [" << tok << "].");

    system::error_code aec;
    {
        engine_scope scope(*this);
        aec = engine_->add(tok, t.cfg_);
    }
    if (aec)
    {
        FLOW_LOG_WARNING("multi [" << this << "]: engine rejected transfer token [" << tok << "]: "
                         "[" << aec << "] [" << aec.message() << "].");
        transfers_.erase(tok);
        t.token_ = 0;
        t.owner_ = nullptr;
        t.state_ = transfer_state::failed;
        t.error_ = aec;
        ec = error::engine_rejected;
        settle();
        return 0;
    }

    ec = {};
    settle();
    return tok;
}

system::error_code
multi_impl::
stop(transfer& t)
{
    if (!contains(t))
        return error::not_registered;

    FLOW_LOG_TRACE("multi [" << this << "]: stop transfer token [" << t.token_ << "].");

    unregister(t.token_, transfer_state::stopped, error::stopped, nullptr);
    settle();
    return {};
}

system::error_code
multi_impl::
pause(transfer& t, pause_mask mask)
{
    if (!contains(t))
        return error::not_registered;

    system::error_code ec;
    {
        engine_scope scope(*this);
        ec = engine_->pause(t.token_, mask);
    }
    settle();
    return ec;
}

system::error_code
multi_impl::
set_option(std::string_view name, option_value const& v)
{
    if (name == "SOCKETFUNCTION" || name == "SOCKETDATA" ||
        name == "TIMERFUNCTION" || name == "TIMERDATA")
        return error::reserved_option;

    return engine_->set_option(name, v);
}

void
multi_impl::
shutdown()
{
    if (!transfers_.empty())
        FLOW_LOG_INFO("multi [" << this << "]: shutting down; stopping "
                      "[" << transfers_.size() << "] transfers.");

    std::vector<transfer_token> toks;
    toks.reserve(transfers_.size());
    for (auto const& [tok, reg] : transfers_)
        toks.push_back(tok);

    for (auto tok : toks)
        if (transfers_.find(tok) != transfers_.end())
            unregister(tok, transfer_state::stopped, error::stopped, nullptr);

    settle();
    fatal_ = false;
    deadline_.disarm();
    sockets_.clear_all();
}

std::size_t
multi_impl::
active() const noexcept
{
    return transfers_.size();
}

bool
multi_impl::
contains(transfer const& t) const noexcept
{
    if (!t.registered())
        return false;
    auto it = transfers_.find(t.token_);
    return it != transfers_.end() && it->second->t == &t;
}

std::string
multi_impl::
version() const
{
    return std::string("corocurl/") + BOOST_COROCURL_VERSION_STRING +
        " " + engine_->version();
}

//------------------------------------------------------------------------------

void
multi_impl::
on_socket_ready(native_handle_type fd, ready_mask ready)
{
    {
        engine_scope scope(*this);
        engine_->socket_action(fd, ready);
    }
    drain_completions();
    settle();
}

void
multi_impl::
on_timer_fire()
{
    {
        engine_scope scope(*this);
        engine_->socket_action(no_descriptor, ready_mask::none);
    }
    drain_completions();
    settle();
}

void
multi_impl::
apply_socket_state(native_handle_type fd, socket_interest what)
{
    if (what == socket_interest::remove)
    {
        FLOW_LOG_TRACE("multi [" << this << "]: unwatch descriptor [" << fd << "].");
        sockets_.clear(fd);
        return;
    }

    FLOW_LOG_TRACE("multi [" << this << "]: watch descriptor [" << fd << "] "
                   "interest [" << static_cast<int>(what) << "].");
    try
    {
        sockets_.set(fd, what);
    }
    catch (system::system_error const& e)
    {
        FLOW_LOG_FATAL("multi [" << this << "]: reactor refused descriptor [" << fd << "]: "
                       "[" << e.code() << "] [" << e.what() << "]; shutting down all transfers.");
        fatal_ = true;
    }
}

void
multi_impl::
apply_timer(std::optional<std::chrono::milliseconds> timeout)
{
    if (!timeout)
    {
        deadline_.disarm();
        return;
    }

    FLOW_LOG_TRACE("multi [" << this << "]: arm deadline [" << timeout->count() << "] ms.");
    deadline_.arm(*timeout);
}

void
multi_impl::
drain_completions()
{
    while (auto c = engine_->next_completion())
    {
        if (transfers_.find(c->token) == transfers_.end())
        {
            // Stopped or cancelled before the engine reported it
            FLOW_LOG_WARNING("multi [" << this << "]: dropping completion for unknown "
                             "transfer token [" << c->token << "].");
            continue;
        }

        if (c->ec)
            unregister(c->token, transfer_state::failed, c->ec, nullptr);
        else
            unregister(c->token, transfer_state::completed, {}, &c->outcome);
    }
}

void
multi_impl::
abandon() noexcept
{
    for (auto& [tok, reg] : transfers_)
    {
        reg->stop_cb.reset();
        reg->t->token_ = 0;
        reg->t->owner_ = nullptr;
        reg->t->state_ = transfer_state::stopped;
    }
    transfers_.clear();
    deferred_.clear();
    deadline_.disarm();
    sockets_.clear_all();
}

//------------------------------------------------------------------------------

void
multi_impl::
on_descriptor_ready(int fd, std::uint32_t events)
{
    ready_mask ready = ready_mask::none;
    if (events & EPOLLIN)
        ready |= ready_mask::read;
    if (events & EPOLLOUT)
        ready |= ready_mask::write;
    if (events & (EPOLLERR | EPOLLHUP))
        ready |= ready_mask::error;
    on_socket_ready(fd, ready);
}

void
multi_impl::canceller::
operator()() const noexcept
{
    self->cancel(tok);
}

void
multi_impl::
cancel(transfer_token tok) noexcept
{
    if (transfers_.find(tok) == transfers_.end())
        return;

    FLOW_LOG_TRACE("multi [" << this << "]: cancel transfer token [" << tok << "].");

    unregister(tok, transfer_state::stopped, capy::error::canceled, nullptr);
    settle();
}

void
multi_impl::
detach(transfer& t) noexcept
{
    if (!contains(t))
        return;

    FLOW_LOG_WARNING("multi [" << this << "]: registered transfer token [" << t.token_ << "] "
                     "destroyed; stopping it.");

    unregister(t.token_, transfer_state::stopped, error::stopped, nullptr);
    settle();
}

void
multi_impl::
unregister(
    transfer_token tok,
    transfer_state state,
    system::error_code ec,
    transfer_outcome* outcome)
{
    // Withdraw from the engine first; it may drop sockets here.
    // Inside an engine call the handle is still in use.
    if (depth_ > 0)
        deferred_.push_back(tok);
    else
        withdraw(tok);

    auto it = transfers_.find(tok);
    if (it == transfers_.end())
        return;
    auto reg = std::move(it->second);
    transfers_.erase(it);

    transfer& t = *reg->t;
    t.token_ = 0;
    t.owner_ = nullptr;
    t.state_ = state;
    if (state == transfer_state::completed && outcome)
        t.outcome_ = *outcome;
    else if (state == transfer_state::failed)
        t.error_ = ec;

    if (!reg->waiting)
        return;

    // May destroy the callback currently running
    reg->stop_cb.reset();

    if (reg->ec_out)
        *reg->ec_out = ec;
    if (reg->out && outcome)
        *reg->out = *outcome;

    post_coro(reg->ex, reg->h);
    sched_.on_work_finished();
}

void
multi_impl::
withdraw(transfer_token tok)
{
    engine_scope scope(*this);
    engine_->remove(tok);
}

void
multi_impl::
settle()
{
    if (depth_ > 0)
        return;

    while (!deferred_.empty() || fatal_)
    {
        auto toks = std::move(deferred_);
        deferred_.clear();
        for (auto tok : toks)
        {
            FLOW_LOG_TRACE("multi [" << this << "]: withdraw transfer token [" << tok << "] "
                           "stopped inside the engine.");
            withdraw(tok);
        }
        check_fatal();
    }
}

void
multi_impl::
check_fatal()
{
    if (fatal_)
        fail_all();
}

void
multi_impl::
fail_all()
{
    fatal_ = false;

    std::vector<transfer_token> toks;
    toks.reserve(transfers_.size());
    for (auto const& [tok, reg] : transfers_)
        toks.push_back(tok);

    for (auto tok : toks)
        if (transfers_.find(tok) != transfers_.end())
            unregister(tok, transfer_state::failed,
                error::subscription_failed, nullptr);

    fatal_ = false;
    deadline_.disarm();
    sockets_.clear_all();
}

void
multi_impl::
on_socket_callback(void* p, native_handle_type fd, socket_interest what)
{
    static_cast<multi_impl*>(p)->apply_socket_state(fd, what);
}

void
multi_impl::
on_timer_callback(void* p, std::optional<std::chrono::milliseconds> timeout)
{
    static_cast<multi_impl*>(p)->apply_timer(timeout);
}

void
multi_impl::
on_deadline(void* p)
{
    static_cast<multi_impl*>(p)->on_timer_fire();
}

//------------------------------------------------------------------------------

multi_service::
multi_service(capy::execution_context&, epoll_scheduler& sched)
    : sched_(sched)
{
}

multi_service::
~multi_service()
{
}

void
multi_service::
shutdown()
{
    while (auto* impl = impls_.pop_front())
    {
        impl->abandon();
        delete impl;
    }
}

multi_impl&
multi_service::
create_impl(
    std::unique_ptr<engine> e,
    flow::log::Logger* logger)
{
    auto* impl = new multi_impl(*this, std::move(e), logger);
    impls_.push_back(impl);
    return *impl;
}

void
multi_service::
destroy_impl(multi_impl& impl) noexcept
{
    impls_.remove(&impl);
    delete &impl;
}

multi_service&
get_multi_service(capy::execution_context& ctx, epoll_scheduler& sched)
{
    return ctx.make_service<multi_service>(sched);
}

} // namespace boost::corocurl::detail
