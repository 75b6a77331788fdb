//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_TRANSFER_HPP
#define BOOST_COROCURL_TRANSFER_HPP

#include <boost/corocurl/detail/config.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace boost::corocurl {

namespace detail {
class multi_impl;
} // namespace detail

/** Identifies a registered transfer at the engine boundary.

    Tokens are assigned by the coordinator and are unique among
    the transfers it has registered. Zero is never assigned.
*/
using transfer_token = std::uint64_t;

/** A sink for received body or header bytes.

    Returns the number of bytes consumed; returning fewer than
    `size` aborts the transfer.
*/
using data_handler = std::function<std::size_t(char const* data, std::size_t size)>;

/** A source of request body bytes.

    Fills at most `size` bytes of `buffer` and returns the number
    written; zero ends the body.
*/
using read_handler = std::function<std::size_t(char* buffer, std::size_t size)>;

/** A 64-bit option argument.

    Distinguishes large-offset options (libcurl's `curl_off_t`)
    from `long` ones, which have the same representation on
    LP64 systems.
*/
struct large_int
{
    std::int64_t value = 0;
};

/** The value of one engine option. */
using option_value = std::variant<
    long,
    large_int,
    std::string,
    std::vector<std::string>,
    data_handler,
    read_handler>;

/** Ordered option-name to value mapping for one transfer.

    The core passes the entries to the engine in insertion
    order without interpreting them.
*/
class BOOST_COROCURL_DECL transfer_config
{
public:
    using value_type = std::pair<std::string, option_value>;
    using const_iterator = std::vector<value_type>::const_iterator;

    transfer_config() = default;

    transfer_config(std::initializer_list<value_type> init);

    /** Set an option, replacing any earlier value for `name`. */
    void set(std::string_view name, option_value v);

    /** Remove an option.

        @return `true` if the option was present.
    */
    bool erase(std::string_view name) noexcept;

    /** Return the value of an option, or null if absent. */
    option_value const* find(std::string_view name) const noexcept;

    std::size_t size() const noexcept { return opts_.size(); }
    bool empty() const noexcept { return opts_.empty(); }
    const_iterator begin() const noexcept { return opts_.begin(); }
    const_iterator end() const noexcept { return opts_.end(); }

private:
    std::vector<value_type> opts_;
};

/** The lifecycle state of a transfer. */
enum class transfer_state
{
    /// Never performed.
    idle,

    /// Registered with a coordinator; a perform is in progress.
    registered,

    /// Ended by `multi::stop`, cancellation, or coordinator shutdown.
    stopped,

    /// Finished successfully; see @ref transfer::outcome.
    completed,

    /// Finished with an engine error; see @ref transfer::error.
    failed
};

/** Summary of a finished transfer. */
struct transfer_outcome
{
    /// The last protocol response code, or zero.
    long response_code = 0;

    /// The last URL used, after any redirects.
    std::string effective_url;

    /// Number of payload bytes received.
    std::int64_t bytes_received = 0;

    /// Total time taken by the transfer.
    std::chrono::microseconds total_time{0};
};

/** One logical network transfer.

    A transfer owns its configuration and records the state and
    result of the most recent perform. It is owned by the caller;
    a coordinator refers to it only while it is registered.

    Destroying a registered transfer stops it; the pending
    perform completes with @ref error::stopped.

    @par Example
    @code
    transfer t({
        {"URL", std::string("https://example.com/")},
        {"FOLLOWLOCATION", 1L}});
    auto [ec, out] = co_await m.perform(t);
    @endcode
*/
class BOOST_COROCURL_DECL transfer
{
public:
    transfer() = default;

    explicit transfer(transfer_config cfg) noexcept;

    /// Stops the transfer if it is registered.
    ~transfer();

    transfer(transfer const&) = delete;
    transfer& operator=(transfer const&) = delete;

    /** Set one option.

        @throws std::logic_error if the transfer is registered.
    */
    void set_option(std::string_view name, option_value v);

    /** Replace the whole configuration.

        @throws std::logic_error if the transfer is registered.
    */
    void set_config(transfer_config cfg);

    transfer_config const&
    config() const noexcept
    {
        return cfg_;
    }

    transfer_state
    state() const noexcept
    {
        return state_;
    }

    /** Return true while a perform is in progress. */
    bool
    registered() const noexcept
    {
        return state_ == transfer_state::registered;
    }

    /** Return the current token, or zero if not registered. */
    transfer_token
    token() const noexcept
    {
        return token_;
    }

    /** Return the outcome of the last completed perform. */
    transfer_outcome const&
    outcome() const noexcept
    {
        return outcome_;
    }

    /** Return the engine error of the last failed perform. */
    system::error_code
    error() const noexcept
    {
        return error_;
    }

private:
    friend class detail::multi_impl;

    transfer_config cfg_;
    detail::multi_impl* owner_ = nullptr;
    transfer_state state_ = transfer_state::idle;
    transfer_token token_ = 0;
    transfer_outcome outcome_;
    system::error_code error_;
};

/** Create an idle transfer from a configuration. */
inline
transfer
create_transfer(transfer_config cfg)
{
    return transfer(std::move(cfg));
}

} // namespace boost::corocurl

#endif
