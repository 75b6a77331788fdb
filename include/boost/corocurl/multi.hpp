//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_MULTI_HPP
#define BOOST_COROCURL_MULTI_HPP

#include <boost/corocurl/detail/config.hpp>
#include <boost/corocurl/engine.hpp>
#include <boost/corocurl/error.hpp>
#include <boost/corocurl/io_object.hpp>
#include <boost/corocurl/transfer.hpp>
#include <boost/capy/io_result.hpp>
#include <boost/capy/ex/executor_ref.hpp>
#include <boost/capy/ex/execution_context.hpp>
#include <boost/system/error_code.hpp>

#include <coroutine>
#include <cstddef>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

namespace flow::log {
class Logger;
} // namespace flow::log

/*
    Transfer Coordinator Public API
    ===============================

    A multi owns one transfer engine and connects it to the reactor
    and timer heap of its io_context. Any number of transfers may be
    performed concurrently on one multi; each perform suspends only
    the task that awaits it.

    Outcomes of co_await m.perform(t):

      ec == {}                      finished; value is the outcome
      ec in the engine's category   the transfer failed
      ec == error::stopped          stop(t), shutdown(), or the multi
                                    was destroyed
      ec == capy::error::canceled   the awaiting task's stop token;
                                    the transfer was unregistered
                                    before the task resumed
      ec == error::engine_rejected  the engine refused the configuration
      ec == error::already_registered
                                    t is being performed elsewhere
      ec == error::already_completed
                                    the awaitable was awaited before

    The last three never suspend.
*/

namespace boost::corocurl {

/** Drives many transfers over one engine on one event loop.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Unsafe.

    @par Example
    @code
    capy::task<>
    fetch(multi& m, std::string url)
    {
        transfer t({{"URL", std::move(url)}});
        auto [ec, out] = co_await m.perform(t);
        if (!ec)
            std::cout << out.response_code << "\n";
    }
    @endcode
*/
class BOOST_COROCURL_DECL multi : public io_object
{
    struct perform_awaitable
    {
        multi& m_;
        transfer& t_;
        std::stop_token token_;
        system::error_code ec_;
        transfer_outcome out_;
        bool done_ = false;

        perform_awaitable(multi& m, transfer& t) noexcept
            : m_(m)
            , t_(t)
        {
        }

        bool await_ready() const noexcept
        {
            return done_;
        }

        capy::io_result<transfer_outcome> await_resume()
        {
            if (done_)
                return {error::already_completed};
            done_ = true;
            if (ec_)
                return {ec_};
            return {ec_, std::move(out_)};
        }

        template<typename Ex>
        auto await_suspend(
            std::coroutine_handle<> h,
            Ex const& ex,
            std::stop_token token) -> std::coroutine_handle<>
        {
            token_ = std::move(token);
            if (m_.get().perform(t_, h, ex, token_, &ec_, &out_))
                return std::noop_coroutine();
            return h;
        }
    };

public:
    struct multi_impl : io_object_impl
    {
        /** Begin a transfer on behalf of a suspended coroutine.

            @return `true` if the coroutine will be resumed later;
                `false` if the result is already stored and the
                coroutine should continue immediately.
        */
        virtual bool perform(
            transfer&,
            std::coroutine_handle<>,
            capy::executor_ref,
            std::stop_token,
            system::error_code*,
            transfer_outcome*) = 0;

        virtual system::error_code stop(transfer&) = 0;
        virtual system::error_code pause(transfer&, pause_mask) = 0;
        virtual system::error_code set_option(
            std::string_view, option_value const&) = 0;
        virtual void shutdown() = 0;
        virtual std::size_t active() const noexcept = 0;
        virtual bool contains(transfer const&) const noexcept = 0;
        virtual std::string version() const = 0;
    };

    /** Destructor.

        Stops every active transfer; their performs complete
        with `error::stopped`. Then destroys the engine.
    */
    ~multi();

    /** Construct a coordinator using libcurl.

        @param ctx The context whose event loop drives transfers.
        @param logger Optional logger; null disables logging.

        @throws boost::system::system_error if libcurl cannot
            be initialized.
    */
    explicit multi(
        capy::execution_context& ctx,
        flow::log::Logger* logger = nullptr);

    /** Construct a coordinator over a given engine.

        @param ctx The context whose event loop drives transfers.
        @param e The engine. The coordinator installs its own
            socket and timer callbacks on it.
        @param logger Optional logger; null disables logging.
    */
    multi(
        capy::execution_context& ctx,
        std::unique_ptr<engine> e,
        flow::log::Logger* logger = nullptr);

    /** Move constructor. */
    multi(multi&& other) noexcept;

    /** Move assignment.

        @throws std::logic_error if the coordinators belong to
            different execution contexts.
    */
    multi& operator=(multi&& other);

    multi(multi const&) = delete;
    multi& operator=(multi const&) = delete;

    /** Perform a transfer.

        The transfer is registered with the engine when the
        returned awaitable is first awaited. The configuration
        cannot be changed until the perform completes.

        @return An awaitable yielding
            `capy::io_result<transfer_outcome>`.
    */
    auto perform(transfer& t)
    {
        return perform_awaitable(*this, t);
    }

    /** Stop a transfer without waiting for the engine.

        The pending perform completes with `error::stopped`, even
        if the engine already reported the transfer finished but
        that report was not yet processed.

        @return `error::not_registered` if `t` is not being
            performed by this coordinator.
    */
    system::error_code stop(transfer& t);

    /** Pause directions of a transfer.

        The transfer stays registered and its perform stays
        suspended.

        @return `error::not_registered` if `t` is not being
            performed by this coordinator, or the engine's error.
    */
    system::error_code pause(transfer& t, pause_mask mask);

    /** Resume all directions of a paused transfer. */
    system::error_code resume(transfer& t)
    {
        return pause(t, pause_mask::cont);
    }

    /** Set an engine-wide option.

        @return `error::reserved_option` for options that carry
            the event loop callbacks, or the engine's error.
    */
    system::error_code set_option(std::string_view name, option_value const& v);

    /** Stop every active transfer and withdraw all subscriptions.

        Idempotent. The coordinator remains usable.
    */
    void shutdown();

    /** Return the number of registered transfers. */
    std::size_t active() const noexcept;

    /** Return true if `t` is registered with this coordinator. */
    bool contains(transfer const& t) const noexcept;

    /** Return the library and engine version. */
    std::string version() const;

private:
    multi_impl& get() const noexcept
    {
        return *static_cast<multi_impl*>(impl_);
    }
};

} // namespace boost::corocurl

#endif
