//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#include <boost/corocurl/curl_engine.hpp>
#include <boost/corocurl/error.hpp>
#include <boost/corocurl/detail/except.hpp>

#include <cstring>
#include <exception>
#include <string>
#include <vector>

/*
    libcurl Engine
    ==============

    One CURL easy handle is created per registered transfer and
    added to a single CURLM multi handle. The easy handle's
    CURLOPT_PRIVATE points at its easy_state, which maps libcurl
    messages back to tokens.

    Each easy_state keeps a copy of the transfer configuration,
    so string, list and handler arguments outlive the transfer
    even if the caller's configuration changes.

    libcurl forbids calling multi functions from inside its own
    callbacks; the socket and timer callbacks only forward to
    the host, which applies them without calling back. Data
    handlers also run inside curl_multi_socket_action; the host
    defers any removal they cause until it returns.
*/

namespace boost::corocurl {

namespace {

system::error_code
make_curl_error(CURLcode rc) noexcept
{
    return system::error_code(static_cast<int>(rc), curl_category());
}

system::error_code
make_multi_error(CURLMcode rc) noexcept
{
    return system::error_code(static_cast<int>(rc), curl_multi_category());
}

// curl_global_init is not thread-safe; function statics are
struct global_init
{
    CURLcode rc;

    global_init() noexcept
        : rc(::curl_global_init(CURL_GLOBAL_DEFAULT))
    {
    }

    ~global_init()
    {
        if (rc == CURLE_OK)
            ::curl_global_cleanup();
    }
};

void
init_curl()
{
    static global_init const init;
    if (init.rc != CURLE_OK)
        detail::throw_system_error(
            make_curl_error(init.rc), "curl_global_init");
}

struct multi_option
{
    char const* name;
    CURLMoption id;
    bool is_off_t;
};

multi_option const multi_options[] = {
    {"MAXCONNECTS",                 CURLMOPT_MAXCONNECTS,                 false},
    {"MAX_HOST_CONNECTIONS",        CURLMOPT_MAX_HOST_CONNECTIONS,        false},
    {"MAX_TOTAL_CONNECTIONS",       CURLMOPT_MAX_TOTAL_CONNECTIONS,       false},
    {"MAX_CONCURRENT_STREAMS",      CURLMOPT_MAX_CONCURRENT_STREAMS,      false},
    {"MAX_PIPELINE_LENGTH",         CURLMOPT_MAX_PIPELINE_LENGTH,         false},
    {"PIPELINING",                  CURLMOPT_PIPELINING,                  false},
    {"CONTENT_LENGTH_PENALTY_SIZE", CURLMOPT_CONTENT_LENGTH_PENALTY_SIZE, true},
    {"CHUNK_LENGTH_PENALTY_SIZE",   CURLMOPT_CHUNK_LENGTH_PENALTY_SIZE,   true},
};

} // namespace

//------------------------------------------------------------------------------

struct curl_engine::easy_state
{
    transfer_token token = 0;
    CURL* easy = nullptr;
    transfer_config cfg;
    std::vector<curl_slist*> lists;
    data_handler write;
    data_handler header;
    read_handler read;

    ~easy_state()
    {
        if (easy)
            ::curl_easy_cleanup(easy);
        for (auto* l : lists)
            ::curl_slist_free_all(l);
    }
};

curl_engine::
curl_engine()
{
    init_curl();

    multi_ = ::curl_multi_init();
    if (!multi_)
        detail::throw_system_error(
            make_multi_error(CURLM_OUT_OF_MEMORY), "curl_multi_init");

    ::curl_multi_setopt(multi_, CURLMOPT_SOCKETFUNCTION, &curl_engine::on_socket);
    ::curl_multi_setopt(multi_, CURLMOPT_SOCKETDATA, this);
    ::curl_multi_setopt(multi_, CURLMOPT_TIMERFUNCTION, &curl_engine::on_timer);
    ::curl_multi_setopt(multi_, CURLMOPT_TIMERDATA, this);
}

curl_engine::
~curl_engine()
{
    for (auto& [tok, st] : easies_)
        ::curl_multi_remove_handle(multi_, st->easy);
    easies_.clear();
    ::curl_multi_cleanup(multi_);
}

system::error_code
curl_engine::
add(transfer_token token, transfer_config const& cfg)
{
    auto st = std::make_unique<easy_state>();
    st->token = token;
    st->cfg = cfg;
    st->easy = ::curl_easy_init();
    if (!st->easy)
        return make_curl_error(CURLE_OUT_OF_MEMORY);

    ::curl_easy_setopt(st->easy, CURLOPT_PRIVATE, st.get());
    ::curl_easy_setopt(st->easy, CURLOPT_NOSIGNAL, 1L);
    ::curl_easy_setopt(st->easy, CURLOPT_WRITEFUNCTION, &curl_engine::on_write);
    ::curl_easy_setopt(st->easy, CURLOPT_WRITEDATA, st.get());

    for (auto const& [name, v] : st->cfg)
    {
        auto ec = apply(*st, name, v);
        if (ec)
            return ec;
    }

    auto* p = st.get();
    easies_.emplace(token, std::move(st));

    // Invokes the timer callback to schedule the first action
    auto mc = ::curl_multi_add_handle(multi_, p->easy);
    if (mc != CURLM_OK)
    {
        easies_.erase(token);
        return make_multi_error(mc);
    }
    return {};
}

system::error_code
curl_engine::
apply(
    easy_state& st,
    std::string const& name,
    option_value const& v)
{
    auto const* opt = ::curl_easy_option_by_name(name.c_str());
    if (!opt)
        return make_curl_error(CURLE_UNKNOWN_OPTION);

    CURLcode rc = CURLE_BAD_FUNCTION_ARGUMENT;

    // Request bodies are object options; copy them with their size
    if (opt->id == CURLOPT_POSTFIELDS || opt->id == CURLOPT_COPYPOSTFIELDS)
    {
        if (auto const* p = std::get_if<std::string>(&v))
        {
            rc = ::curl_easy_setopt(st.easy, CURLOPT_POSTFIELDSIZE_LARGE,
                static_cast<curl_off_t>(p->size()));
            if (rc == CURLE_OK)
                rc = ::curl_easy_setopt(st.easy, CURLOPT_COPYPOSTFIELDS, p->data());
        }
        return rc == CURLE_OK ? system::error_code() : make_curl_error(rc);
    }

    switch (opt->type)
    {
    case CURLOT_LONG:
    case CURLOT_VALUES:
        if (auto const* p = std::get_if<long>(&v))
            rc = ::curl_easy_setopt(st.easy, opt->id, *p);
        break;

    case CURLOT_OFF_T:
        if (auto const* p = std::get_if<large_int>(&v))
            rc = ::curl_easy_setopt(st.easy, opt->id,
                static_cast<curl_off_t>(p->value));
        else if (auto const* q = std::get_if<long>(&v))
            rc = ::curl_easy_setopt(st.easy, opt->id,
                static_cast<curl_off_t>(*q));
        break;

    case CURLOT_STRING:
        if (auto const* p = std::get_if<std::string>(&v))
            rc = ::curl_easy_setopt(st.easy, opt->id, p->c_str());
        break;

    case CURLOT_BLOB:
        if (auto const* p = std::get_if<std::string>(&v))
        {
            curl_blob blob;
            blob.data = const_cast<char*>(p->data());
            blob.len = p->size();
            blob.flags = CURL_BLOB_COPY;
            rc = ::curl_easy_setopt(st.easy, opt->id, &blob);
        }
        break;

    case CURLOT_SLIST:
        if (auto const* p = std::get_if<std::vector<std::string>>(&v))
        {
            curl_slist* list = nullptr;
            for (auto const& s : *p)
            {
                auto* next = ::curl_slist_append(list, s.c_str());
                if (!next)
                {
                    ::curl_slist_free_all(list);
                    return make_curl_error(CURLE_OUT_OF_MEMORY);
                }
                list = next;
            }
            st.lists.push_back(list);
            rc = ::curl_easy_setopt(st.easy, opt->id, list);
        }
        break;

    case CURLOT_FUNCTION:
        if (auto const* p = std::get_if<data_handler>(&v))
        {
            if (opt->id == CURLOPT_WRITEFUNCTION)
            {
                st.write = *p;
                rc = CURLE_OK;
            }
            else if (opt->id == CURLOPT_HEADERFUNCTION)
            {
                st.header = *p;
                rc = ::curl_easy_setopt(st.easy, CURLOPT_HEADERFUNCTION,
                    &curl_engine::on_header);
                if (rc == CURLE_OK)
                    rc = ::curl_easy_setopt(st.easy, CURLOPT_HEADERDATA, &st);
            }
        }
        else if (auto const* r = std::get_if<read_handler>(&v))
        {
            if (opt->id == CURLOPT_READFUNCTION)
            {
                st.read = *r;
                rc = ::curl_easy_setopt(st.easy, CURLOPT_READFUNCTION,
                    &curl_engine::on_read);
                if (rc == CURLE_OK)
                    rc = ::curl_easy_setopt(st.easy, CURLOPT_READDATA, &st);
            }
        }
        break;

    default:
        // Pointer and callback-data options belong to the engine
        break;
    }

    return rc == CURLE_OK ? system::error_code() : make_curl_error(rc);
}

void
curl_engine::
remove(transfer_token token)
{
    auto it = easies_.find(token);
    if (it == easies_.end())
        return;

    // May invoke the socket callback with CURL_POLL_REMOVE.
    // A handle libcurl refused to release is still in use; it
    // is kept until the engine is destroyed.
    auto mc = ::curl_multi_remove_handle(multi_, it->second->easy);
    if (mc != CURLM_OK)
        return;
    easies_.erase(it);
}

int
curl_engine::
socket_action(native_handle_type fd, ready_mask ready)
{
    int ev = 0;
    if ((ready & ready_mask::read) != ready_mask::none)
        ev |= CURL_CSELECT_IN;
    if ((ready & ready_mask::write) != ready_mask::none)
        ev |= CURL_CSELECT_OUT;
    if ((ready & ready_mask::error) != ready_mask::none)
        ev |= CURL_CSELECT_ERR;

    curl_socket_t s = (fd == no_descriptor)
        ? CURL_SOCKET_TIMEOUT
        : static_cast<curl_socket_t>(fd);

    int running = 0;
    auto mc = ::curl_multi_socket_action(multi_, s, ev, &running);

    // A descriptor libcurl already dropped is not an error
    if (mc != CURLM_OK && mc != CURLM_BAD_SOCKET)
        detail::throw_system_error(
            make_multi_error(mc), "curl_multi_socket_action");
    return running;
}

void
curl_engine::
set_socket_callback(socket_callback cb)
{
    socket_cb_ = cb;
}

void
curl_engine::
set_timer_callback(timer_callback cb)
{
    timer_cb_ = cb;
}

std::optional<completion>
curl_engine::
next_completion()
{
    int left = 0;
    while (CURLMsg* msg = ::curl_multi_info_read(multi_, &left))
    {
        if (msg->msg != CURLMSG_DONE)
            continue;

        char* priv = nullptr;
        ::curl_easy_getinfo(msg->easy_handle, CURLINFO_PRIVATE, &priv);
        auto* st = reinterpret_cast<easy_state*>(priv);

        completion c;
        c.token = st->token;
        if (msg->data.result != CURLE_OK)
        {
            c.ec = make_curl_error(msg->data.result);
            return c;
        }

        long code = 0;
        char* url = nullptr;
        curl_off_t size = 0;
        curl_off_t total = 0;
        ::curl_easy_getinfo(st->easy, CURLINFO_RESPONSE_CODE, &code);
        ::curl_easy_getinfo(st->easy, CURLINFO_EFFECTIVE_URL, &url);
        ::curl_easy_getinfo(st->easy, CURLINFO_SIZE_DOWNLOAD_T, &size);
        ::curl_easy_getinfo(st->easy, CURLINFO_TOTAL_TIME_T, &total);

        c.outcome.response_code = code;
        if (url)
            c.outcome.effective_url = url;
        c.outcome.bytes_received = static_cast<std::int64_t>(size);
        c.outcome.total_time = std::chrono::microseconds(total);
        return c;
    }
    return std::nullopt;
}

system::error_code
curl_engine::
pause(transfer_token token, pause_mask mask)
{
    auto it = easies_.find(token);
    if (it == easies_.end())
        return error::not_registered;

    int bits = CURLPAUSE_CONT;
    switch (mask)
    {
    case pause_mask::cont: bits = CURLPAUSE_CONT; break;
    case pause_mask::recv: bits = CURLPAUSE_RECV; break;
    case pause_mask::send: bits = CURLPAUSE_SEND; break;
    case pause_mask::all:  bits = CURLPAUSE_ALL;  break;
    }

    auto rc = ::curl_easy_pause(it->second->easy, bits);
    return rc == CURLE_OK ? system::error_code() : make_curl_error(rc);
}

system::error_code
curl_engine::
set_option(std::string_view name, option_value const& v)
{
    for (auto const& o : multi_options)
    {
        if (name != o.name)
            continue;

        CURLMcode mc;
        if (auto const* p = std::get_if<long>(&v))
        {
            if (o.is_off_t)
                mc = ::curl_multi_setopt(multi_, o.id, static_cast<curl_off_t>(*p));
            else
                mc = ::curl_multi_setopt(multi_, o.id, *p);
        }
        else if (auto const* q = std::get_if<large_int>(&v); q && o.is_off_t)
        {
            mc = ::curl_multi_setopt(multi_, o.id, static_cast<curl_off_t>(q->value));
        }
        else
        {
            return error::engine_rejected;
        }
        return mc == CURLM_OK ? system::error_code() : make_multi_error(mc);
    }
    return error::engine_rejected;
}

std::string
curl_engine::
version() const
{
    return ::curl_version();
}

//------------------------------------------------------------------------------

int
curl_engine::
on_socket(CURL*, curl_socket_t s, int what, void* userp, void*)
{
    auto* self = static_cast<curl_engine*>(userp);
    auto fd = static_cast<native_handle_type>(s);
    switch (what)
    {
    case CURL_POLL_IN:
        self->socket_cb_(fd, socket_interest::want_read);
        break;
    case CURL_POLL_OUT:
        self->socket_cb_(fd, socket_interest::want_write);
        break;
    case CURL_POLL_INOUT:
        self->socket_cb_(fd, socket_interest::want_both);
        break;
    case CURL_POLL_REMOVE:
        self->socket_cb_(fd, socket_interest::remove);
        break;
    default:
        break;
    }
    return 0;
}

int
curl_engine::
on_timer(CURLM*, long timeout_ms, void* userp)
{
    auto* self = static_cast<curl_engine*>(userp);
    if (timeout_ms < 0)
        self->timer_cb_(std::nullopt);
    else
        self->timer_cb_(std::chrono::milliseconds(timeout_ms));
    return 0;
}

std::size_t
curl_engine::
on_write(char* p, std::size_t size, std::size_t nmemb, void* userp)
{
    auto* st = static_cast<easy_state*>(userp);
    std::size_t n = size * nmemb;
    if (!st->write)
        return n;

    // Exceptions cannot cross libcurl; a short count fails the transfer
    try
    {
        return st->write(p, n);
    }
    catch (std::exception const&)
    {
        return 0;
    }
}

std::size_t
curl_engine::
on_header(char* p, std::size_t size, std::size_t nmemb, void* userp)
{
    auto* st = static_cast<easy_state*>(userp);
    std::size_t n = size * nmemb;
    try
    {
        return st->header(p, n);
    }
    catch (std::exception const&)
    {
        return 0;
    }
}

std::size_t
curl_engine::
on_read(char* p, std::size_t size, std::size_t nmemb, void* userp)
{
    auto* st = static_cast<easy_state*>(userp);
    try
    {
        return st->read(p, size * nmemb);
    }
    catch (std::exception const&)
    {
        return CURL_READFUNC_ABORT;
    }
}

} // namespace boost::corocurl
