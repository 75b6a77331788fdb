//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_ENGINE_HPP
#define BOOST_COROCURL_ENGINE_HPP

#include <boost/corocurl/detail/config.hpp>
#include <boost/corocurl/transfer.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

/*
    Engine Boundary
    ===============

    A transfer engine performs the network work for many transfers
    at once and is driven entirely by its host:

      - The host registers transfers with add() and withdraws them
        with remove().

      - The engine tells the host which descriptors it needs watched
        through the socket callback, and when it next needs to run
        through the timer callback. Both callbacks are invoked
        synchronously from inside add(), remove() and
        socket_action(); the host applies them immediately.

      - The host reports readiness and expired deadlines with
        socket_action(), then reads finished transfers from
        next_completion() until it is empty.

      - Transfer handlers run inside socket_action(). The host
        never calls back into the engine from inside one of its
        entry points; a transfer stopped there is removed after
        the outermost call returns.

    The engine never owns transfer objects; it knows them only by
    the tokens the host assigns.
*/

namespace boost::corocurl {

/// The native descriptor type.
using native_handle_type = int;

/// Passed to `engine::socket_action` when a deadline expired.
inline constexpr native_handle_type no_descriptor = -1;

/** The readiness an engine asks to be watched for. */
enum class socket_interest
{
    want_read,
    want_write,
    want_both,

    /// Stop watching the descriptor.
    remove
};

/** Readiness reported to the engine. */
enum class ready_mask : unsigned
{
    none  = 0,
    read  = 1,
    write = 2,
    error = 4
};

constexpr ready_mask operator|(ready_mask a, ready_mask b) noexcept
{
    return static_cast<ready_mask>(
        static_cast<unsigned>(a) | static_cast<unsigned>(b));
}

constexpr ready_mask operator&(ready_mask a, ready_mask b) noexcept
{
    return static_cast<ready_mask>(
        static_cast<unsigned>(a) & static_cast<unsigned>(b));
}

constexpr ready_mask& operator|=(ready_mask& a, ready_mask b) noexcept
{
    return a = a | b;
}

/** Directions to pause.

    `cont` unpauses both directions.
*/
enum class pause_mask : unsigned
{
    cont = 0,
    recv = 1,
    send = 2,
    all  = 3
};

/** A finished transfer reported by the engine. */
struct completion
{
    transfer_token token = 0;

    /// The engine error, or empty on success.
    system::error_code ec;

    /// Meaningful only on success.
    transfer_outcome outcome;
};

/** Receives socket interest changes from an engine. */
class socket_callback
{
    void* ctx_ = nullptr;
    void(*fn_)(void*, native_handle_type, socket_interest) = nullptr;

public:
    socket_callback() = default;

    socket_callback(
        void* ctx,
        void(*fn)(void*, native_handle_type, socket_interest)) noexcept
        : ctx_(ctx), fn_(fn) {}

    explicit operator bool() const noexcept { return fn_ != nullptr; }

    void operator()(native_handle_type fd, socket_interest what) const
    {
        if (fn_)
            fn_(ctx_, fd, what);
    }
};

/** Receives deadline changes from an engine.

    An empty optional cancels the deadline. A zero duration
    asks to be run as soon as possible.
*/
class timer_callback
{
    void* ctx_ = nullptr;
    void(*fn_)(void*, std::optional<std::chrono::milliseconds>) = nullptr;

public:
    timer_callback() = default;

    timer_callback(
        void* ctx,
        void(*fn)(void*, std::optional<std::chrono::milliseconds>)) noexcept
        : ctx_(ctx), fn_(fn) {}

    explicit operator bool() const noexcept { return fn_ != nullptr; }

    void operator()(std::optional<std::chrono::milliseconds> timeout) const
    {
        if (fn_)
            fn_(ctx_, timeout);
    }
};

/** Abstract multi-transfer engine.

    @see curl_engine, test::fake_engine
*/
class BOOST_COROCURL_DECL engine
{
public:
    virtual ~engine() = default;

    /** Register a transfer.

        May invoke the socket and timer callbacks before returning.

        @return An error if the configuration is refused; the
            transfer is then not registered.
    */
    virtual system::error_code add(
        transfer_token token,
        transfer_config const& cfg) = 0;

    /** Withdraw a transfer. Unknown tokens are ignored.

        Never called from inside another engine entry point.
    */
    virtual void remove(transfer_token token) = 0;

    /** Act on readiness or an expired deadline.

        @param fd The ready descriptor, or `no_descriptor` when
            the deadline expired. A descriptor the engine no
            longer uses is ignored.
        @param ready The readiness observed.

        @return The number of transfers still running.
    */
    virtual int socket_action(native_handle_type fd, ready_mask ready) = 0;

    virtual void set_socket_callback(socket_callback cb) = 0;
    virtual void set_timer_callback(timer_callback cb) = 0;

    /** Return the next finished transfer, if any. */
    virtual std::optional<completion> next_completion() = 0;

    /** Pause or resume directions of a registered transfer. */
    virtual system::error_code pause(transfer_token token, pause_mask mask) = 0;

    /** Set an engine-wide option. */
    virtual system::error_code set_option(
        std::string_view name,
        option_value const& v) = 0;

    /** Return a description of the engine and its version. */
    virtual std::string version() const = 0;
};

} // namespace boost::corocurl

#endif
