//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_SRC_DETAIL_MULTI_SERVICE_HPP
#define BOOST_COROCURL_SRC_DETAIL_MULTI_SERVICE_HPP

#include <boost/corocurl/detail/config.hpp>
#include <boost/corocurl/engine.hpp>
#include <boost/corocurl/multi.hpp>
#include <boost/corocurl/transfer.hpp>
#include <boost/capy/coro.hpp>
#include <boost/capy/ex/executor_ref.hpp>
#include <boost/capy/ex/execution_context.hpp>
#include <boost/system/error_code.hpp>

#include "src/detail/epoll/scheduler.hpp"
#include "src/detail/intrusive.hpp"
#include "src/detail/socket_registry.hpp"
#include "src/detail/timer_line.hpp"

#include <flow/log/log.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <stop_token>
#include <unordered_map>
#include <vector>

/*
    Transfer Coordinator
    ====================

    multi_impl owns one engine and translates between it and the
    event loop:

      engine socket callback  ->  apply_socket_state  ->  socket_registry
      engine timer callback   ->  apply_timer         ->  timer_line
      descriptor readiness    ->  on_socket_ready     ->  engine::socket_action
      deadline expiry         ->  on_timer_fire       ->  engine::socket_action
      after every action      ->  drain_completions   ->  resolve

    Reentrancy
    ----------
    The engine invokes apply_socket_state and apply_timer
    synchronously from inside add(), remove() and socket_action().
    They only touch the registry and the timer line, never the
    registration table, so they are safe at any point, including
    while completions are being drained.

    Resolution
    ----------
    A registration is removed from the table, its engine
    registration withdrawn and its transfer updated before the
    waiting coroutine is posted. Coroutines are never resumed from
    inside an engine call or a stop callback. Each suspended
    perform holds one unit of scheduler work, released after its
    resumption is posted.

    Engine depth
    ------------
    The engine must not be called from inside its own callbacks,
    and a transfer's data handlers run inside socket_action().
    Every engine entry point is bracketed by an engine_scope. A
    stop, cancel or shutdown requested at depth > 0 resolves the
    registration immediately but queues the engine removal;
    settle() withdraws the queued tokens once the outermost
    engine call has returned.

    Subscription failure
    --------------------
    If the reactor refuses a descriptor, the coordinator can no
    longer honour the engine's requests. The failure is recorded
    inside the callback, and settle() then resolves every
    registration with error::subscription_failed and drops all
    subscriptions.
*/

namespace boost::corocurl::detail {

class multi_service;

class multi_impl
    : public multi::multi_impl
    , public descriptor_watch
    , public intrusive_list<multi_impl>::node
    , public flow::log::Log_context
{
public:
    multi_impl(
        multi_service& svc,
        std::unique_ptr<engine> e,
        flow::log::Logger* logger);

    ~multi_impl();

    multi_impl(multi_impl const&) = delete;
    multi_impl& operator=(multi_impl const&) = delete;

    // multi::multi_impl

    void release() override;

    bool perform(
        transfer& t,
        std::coroutine_handle<> h,
        capy::executor_ref ex,
        std::stop_token token,
        system::error_code* ec,
        transfer_outcome* out) override;

    system::error_code stop(transfer& t) override;
    system::error_code pause(transfer& t, pause_mask mask) override;
    system::error_code set_option(
        std::string_view name, option_value const& v) override;
    void shutdown() override;
    std::size_t active() const noexcept override;
    bool contains(transfer const& t) const noexcept override;
    std::string version() const override;

    // Coordination

    /** Register a transfer with the engine.

        @return The new token, or zero with `ec` set.
    */
    transfer_token add(transfer& t, system::error_code& ec);

    void on_socket_ready(native_handle_type fd, ready_mask ready);
    void on_timer_fire();
    void apply_socket_state(native_handle_type fd, socket_interest what);
    void apply_timer(std::optional<std::chrono::milliseconds> timeout);
    void drain_completions();

    /** Withdraw a transfer that is being destroyed.

        The waiting coroutine, if any, sees error::stopped.
    */
    void detach(transfer& t) noexcept;

    /** Drop everything without resuming any coroutine.

        Used when the owning context is destroyed.
    */
    void abandon() noexcept;

    socket_registry const& sockets() const noexcept { return sockets_; }
    timer_line const& deadline() const noexcept { return deadline_; }

private:
    struct registration;

    struct engine_scope
    {
        multi_impl& self;

        explicit engine_scope(multi_impl& m) noexcept
            : self(m)
        {
            ++self.depth_;
        }

        ~engine_scope()
        {
            --self.depth_;
        }
    };

    struct canceller
    {
        multi_impl* self;
        transfer_token tok;
        void operator()() const noexcept;
    };

    struct registration
    {
        transfer* t = nullptr;
        capy::coro h;
        capy::executor_ref ex;
        system::error_code* ec_out = nullptr;
        transfer_outcome* out = nullptr;
        bool waiting = false;
        std::optional<std::stop_callback<canceller>> stop_cb;
    };

    using table = std::unordered_map<
        transfer_token, std::unique_ptr<registration>>;

    void on_descriptor_ready(int fd, std::uint32_t events) override;

    void cancel(transfer_token tok) noexcept;
    void unregister(
        transfer_token tok,
        transfer_state state,
        system::error_code ec,
        transfer_outcome* outcome);
    void withdraw(transfer_token tok);
    void settle();
    void check_fatal();
    void fail_all();

    static void on_socket_callback(
        void* p, native_handle_type fd, socket_interest what);
    static void on_timer_callback(
        void* p, std::optional<std::chrono::milliseconds> timeout);
    static void on_deadline(void* p);

    multi_service& svc_;
    epoll_scheduler& sched_;
    std::unique_ptr<engine> engine_;
    socket_registry sockets_;
    timer_line deadline_;
    table transfers_;
    transfer_token next_token_ = 1;
    std::vector<transfer_token> deferred_;
    int depth_ = 0;
    bool fatal_ = false;
};

//------------------------------------------------------------------------------

/** Owns the coordinators of one execution context. */
class multi_service : public capy::execution_context::service
{
public:
    using key_type = multi_service;

    multi_service(capy::execution_context& ctx, epoll_scheduler& sched);
    ~multi_service();

    multi_service(multi_service const&) = delete;
    multi_service& operator=(multi_service const&) = delete;

    void shutdown() override;

    multi_impl& create_impl(
        std::unique_ptr<engine> e,
        flow::log::Logger* logger);

    void destroy_impl(multi_impl& impl) noexcept;

    epoll_scheduler& get_scheduler() const noexcept { return sched_; }

private:
    epoll_scheduler& sched_;
    intrusive_list<multi_impl> impls_;
};

/** Return the transfer service of a context, creating it if needed. */
multi_service&
get_multi_service(capy::execution_context& ctx, epoll_scheduler& sched);

} // namespace boost::corocurl::detail

#endif
