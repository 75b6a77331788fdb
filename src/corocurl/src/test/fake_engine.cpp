//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#include <boost/corocurl/test/fake_engine.hpp>
#include <boost/corocurl/error.hpp>

namespace boost::corocurl::test {

system::error_code
fake_engine::
add(transfer_token token, transfer_config const& cfg)
{
    if (on_add)
    {
        // Registered while the hook runs, so it may complete the token
        running_.insert(token);
        auto ec = on_add(token, cfg);
        if (ec)
        {
            running_.erase(token);
            return ec;
        }
    }
    running_.insert(token);
    added_.push_back(token);
    return {};
}

void
fake_engine::
remove(transfer_token token)
{
    if (running_.erase(token) == 0)
        return;
    removed_.push_back(token);

    if (on_remove)
        on_remove(token);
}

int
fake_engine::
socket_action(native_handle_type fd, ready_mask ready)
{
    actions_.push_back({fd, ready});
    if (on_action)
        on_action(fd, ready);
    return static_cast<int>(running_.size());
}

void
fake_engine::
set_socket_callback(socket_callback cb)
{
    socket_cb_ = cb;
}

void
fake_engine::
set_timer_callback(timer_callback cb)
{
    timer_cb_ = cb;
}

std::optional<completion>
fake_engine::
next_completion()
{
    if (done_.empty())
        return std::nullopt;
    auto c = std::move(done_.front());
    done_.pop_front();
    running_.erase(c.token);
    return c;
}

system::error_code
fake_engine::
pause(transfer_token token, pause_mask mask)
{
    if (!running(token))
        return error::not_registered;
    pauses_.emplace_back(token, mask);
    return {};
}

system::error_code
fake_engine::
set_option(std::string_view name, option_value const&)
{
    options_.emplace_back(name);
    return {};
}

std::string
fake_engine::
version() const
{
    return "fake/1.0";
}

void
fake_engine::
request_socket(native_handle_type fd, socket_interest what)
{
    socket_cb_(fd, what);
}

void
fake_engine::
request_timer(std::optional<std::chrono::milliseconds> timeout)
{
    timer_cb_(timeout);
}

void
fake_engine::
complete(
    transfer_token token,
    system::error_code ec,
    transfer_outcome outcome)
{
    completion c;
    c.token = token;
    c.ec = ec;
    c.outcome = std::move(outcome);
    done_.push_back(std::move(c));
}

} // namespace boost::corocurl::test
