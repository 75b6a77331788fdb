//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_CURL_ENGINE_HPP
#define BOOST_COROCURL_CURL_ENGINE_HPP

#include <boost/corocurl/detail/config.hpp>
#include <boost/corocurl/engine.hpp>

#include <curl/curl.h>

#include <memory>
#include <unordered_map>

namespace boost::corocurl {

/** A transfer engine backed by the libcurl multi-socket interface.

    Transfer options are libcurl easy options named without the
    `CURLOPT_` prefix, for example `"URL"`, `"HTTPHEADER"` or
    `"TIMEOUT_MS"`. Values must match the option's type:

      - `long` for numeric and enumerated options
      - `large_int` (or `long`) for `curl_off_t` options
      - `std::string` for string and blob options, and for
        `POSTFIELDS` and `COPYPOSTFIELDS`, which are copied with
        their length so the body may hold any bytes
      - `std::vector<std::string>` for list options
      - `data_handler` for `WRITEFUNCTION` and `HEADERFUNCTION`
      - `read_handler` for `READFUNCTION`

    Without a `WRITEFUNCTION`, received bodies are discarded.
    Engine-wide options are the `CURLMOPT_` names without the
    prefix, for example `"MAXCONNECTS"`.

    Failed transfers report `CURLcode` values in
    @ref curl_category.
*/
class BOOST_COROCURL_DECL curl_engine : public engine
{
public:
    /** Constructor.

        Initializes libcurl for the process on first use.

        @throws boost::system::system_error if libcurl cannot
            be initialized.
    */
    curl_engine();

    /// Withdraws every transfer, then releases the multi handle.
    ~curl_engine();

    curl_engine(curl_engine const&) = delete;
    curl_engine& operator=(curl_engine const&) = delete;

    system::error_code add(
        transfer_token token,
        transfer_config const& cfg) override;
    void remove(transfer_token token) override;
    int socket_action(native_handle_type fd, ready_mask ready) override;
    void set_socket_callback(socket_callback cb) override;
    void set_timer_callback(timer_callback cb) override;
    std::optional<completion> next_completion() override;
    system::error_code pause(transfer_token token, pause_mask mask) override;
    system::error_code set_option(
        std::string_view name,
        option_value const& v) override;
    std::string version() const override;

private:
    struct easy_state;

    system::error_code apply(
        easy_state& st,
        std::string const& name,
        option_value const& v);

    static int on_socket(CURL*, curl_socket_t, int, void*, void*);
    static int on_timer(CURLM*, long, void*);
    static std::size_t on_write(char*, std::size_t, std::size_t, void*);
    static std::size_t on_header(char*, std::size_t, std::size_t, void*);
    static std::size_t on_read(char*, std::size_t, std::size_t, void*);

    CURLM* multi_ = nullptr;
    socket_callback socket_cb_;
    timer_callback timer_cb_;
    std::unordered_map<transfer_token, std::unique_ptr<easy_state>> easies_;
};

} // namespace boost::corocurl

#endif
