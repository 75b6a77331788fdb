//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

// Test that header file is self-contained.
#include <boost/corocurl/multi.hpp>

#include <boost/corocurl/io_context.hpp>
#include <boost/corocurl/test/fake_engine.hpp>
#include <boost/corocurl/timer.hpp>
#include <boost/capy/cond.hpp>
#include <boost/capy/ex/run_async.hpp>
#include <boost/capy/task.hpp>
#include <boost/core/lightweight_test.hpp>

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <variant>
#include <vector>

namespace boost::corocurl {

namespace {

struct result
{
    bool done = false;
    int resumed = 0;
    system::error_code ec;
    transfer_outcome out;
};

capy::task<>
perform_task(multi& m, transfer& t, result& r)
{
    auto [ec, out] = co_await m.perform(t);
    ++r.resumed;
    r.done = true;
    r.ec = ec;
    r.out = std::move(out);
}

struct pipe_fds
{
    int rd = -1;
    int wr = -1;

    pipe_fds()
    {
        int fds[2];
        if (::pipe2(fds, O_NONBLOCK | O_CLOEXEC) == 0)
        {
            rd = fds[0];
            wr = fds[1];
        }
    }

    ~pipe_fds()
    {
        ::close(rd);
        ::close(wr);
    }
};

std::string
url_of(transfer_config const& cfg)
{
    auto const* v = cfg.find("URL");
    if (!v)
        return {};
    return std::get<std::string>(*v);
}

transfer_outcome
make_outcome(long code)
{
    transfer_outcome o;
    o.response_code = code;
    o.bytes_received = 5;
    return o;
}

system::error_code
couldnt_connect()
{
    return system::error_code(7, curl_category());
}

} // namespace

//------------------------------------------------
// Transfer coordinator tests
// Focus: every perform resolves exactly once, with
// nothing left registered or subscribed afterwards.
//------------------------------------------------

struct multi_test
{
    void
    testNullEngineThrows()
    {
        io_context ioc;
        BOOST_TEST_THROWS(
            multi(ioc, std::unique_ptr<engine>()),
            std::logic_error);
    }

    void
    testVersion()
    {
        io_context ioc;
        multi m(ioc, std::make_unique<test::fake_engine>());
        BOOST_TEST(m.version().find("fake/1.0") != std::string::npos);
    }

    // Engine watches a descriptor and asks for a 0ms
    // deadline; the deadline fires first and reports 200.
    void
    testTimerFiresFirst()
    {
        io_context ioc;
        pipe_fds p;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        transfer_token tok = 0;
        fe.on_add = [&](transfer_token t, transfer_config const&)
        {
            tok = t;
            fe.request_socket(p.rd, socket_interest::want_read);
            fe.request_timer(std::chrono::milliseconds(0));
            return system::error_code();
        };
        fe.on_action = [&](native_handle_type fd, ready_mask)
        {
            if (fd != no_descriptor)
                return;
            fe.complete(tok, {}, make_outcome(200));
            fe.request_socket(p.rd, socket_interest::remove);
            fe.request_timer(std::nullopt);
        };

        transfer a({{"URL", std::string("http://a/")}});
        result r;
        capy::run_async(ioc.get_executor())(perform_task(m, a, r));
        ioc.run();

        BOOST_TEST(r.done);
        BOOST_TEST_EQ(r.resumed, 1);
        BOOST_TEST(!r.ec);
        BOOST_TEST_EQ(r.out.response_code, 200);
        BOOST_TEST_EQ(fe.actions().size(), 1u);
        BOOST_TEST_EQ(fe.actions()[0].fd, no_descriptor);
        BOOST_TEST(a.state() == transfer_state::completed);
        BOOST_TEST_EQ(a.outcome().response_code, 200);
        BOOST_TEST_EQ(a.token(), 0u);
        BOOST_TEST_EQ(m.active(), 0u);
    }

    void
    testSocketReadiness()
    {
        io_context ioc;
        pipe_fds p;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        transfer_token tok = 0;
        fe.on_add = [&](transfer_token t, transfer_config const&)
        {
            tok = t;
            fe.request_socket(p.rd, socket_interest::want_read);
            return system::error_code();
        };
        fe.on_action = [&](native_handle_type fd, ready_mask ready)
        {
            BOOST_TEST_EQ(fd, p.rd);
            BOOST_TEST((ready & ready_mask::read) != ready_mask::none);
            fe.request_socket(p.rd, socket_interest::remove);
            fe.complete(tok, {}, make_outcome(204));
        };

        BOOST_TEST_EQ(::write(p.wr, "x", 1), 1);

        transfer a({{"URL", std::string("http://a/")}});
        result r;
        capy::run_async(ioc.get_executor())(perform_task(m, a, r));
        ioc.run();

        BOOST_TEST(r.done);
        BOOST_TEST(!r.ec);
        BOOST_TEST_EQ(r.out.response_code, 204);

        // Level-triggered, yet withdrawn after one action
        BOOST_TEST_EQ(fe.actions().size(), 1u);
    }

    void
    testTimerReplaced()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        transfer_token tok = 0;
        fe.on_add = [&](transfer_token t, transfer_config const&)
        {
            tok = t;
            fe.request_timer(std::chrono::seconds(60));
            fe.request_timer(std::chrono::milliseconds(1));
            return system::error_code();
        };
        fe.on_action = [&](native_handle_type, ready_mask)
        {
            fe.complete(tok, {}, make_outcome(200));
        };

        transfer a({{"URL", std::string("http://a/")}});
        result r;
        auto start = std::chrono::steady_clock::now();
        capy::run_async(ioc.get_executor())(perform_task(m, a, r));
        ioc.run();

        BOOST_TEST(r.done);
        BOOST_TEST(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
        BOOST_TEST_EQ(fe.actions().size(), 1u);
    }

    void
    testTimerCancelled()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        fe.on_add = [&](transfer_token, transfer_config const&)
        {
            fe.request_timer(std::chrono::milliseconds(0));
            fe.request_timer(std::nullopt);
            return system::error_code();
        };

        transfer a({{"URL", std::string("http://a/")}});
        result r;
        capy::run_async(ioc.get_executor())(perform_task(m, a, r));

        timer delay(ioc);
        delay.expires_after(std::chrono::milliseconds(20));
        auto stopper = [](timer& d, multi& m_ref, transfer& t,
            test::fake_engine& f) -> capy::task<>
        {
            (void)co_await d.wait();
            BOOST_TEST(f.actions().empty());
            BOOST_TEST(!m_ref.stop(t));
        };
        capy::run_async(ioc.get_executor())(stopper(delay, m, a, fe));
        ioc.run();

        BOOST_TEST(r.done);
        BOOST_TEST(r.ec == error::stopped);
        BOOST_TEST(fe.actions().empty());
    }

    // Many transfers on one coordinator resolve independently
    void
    testIsolation()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        std::vector<std::pair<transfer_token, std::string>> regs;
        fe.on_add = [&](transfer_token t, transfer_config const& cfg)
        {
            regs.emplace_back(t, url_of(cfg));
            fe.request_timer(std::chrono::milliseconds(0));
            return system::error_code();
        };
        fe.on_action = [&](native_handle_type, ready_mask)
        {
            // Report in reverse order of registration
            for (auto it = regs.rbegin(); it != regs.rend(); ++it)
            {
                if (!fe.running(it->first))
                    continue;
                if (it->second == "2")
                    fe.complete(it->first, couldnt_connect());
                else
                    fe.complete(it->first, {},
                        make_outcome(200 + std::stol(it->second)));
            }
        };

        constexpr int n = 5;
        std::vector<std::unique_ptr<transfer>> ts;
        std::vector<result> rs(n);
        for (int i = 0; i < n; ++i)
        {
            ts.push_back(std::make_unique<transfer>(
                transfer_config{{"URL", std::to_string(i)}}));
            capy::run_async(ioc.get_executor())(perform_task(m, *ts.back(), rs[i]));
        }
        ioc.run();

        for (int i = 0; i < n; ++i)
        {
            BOOST_TEST_EQ(rs[i].resumed, 1);
            if (i == 2)
            {
                BOOST_TEST(rs[i].ec == couldnt_connect());
                BOOST_TEST(ts[i]->state() == transfer_state::failed);
                BOOST_TEST(ts[i]->error() == couldnt_connect());
            }
            else
            {
                BOOST_TEST(!rs[i].ec);
                BOOST_TEST_EQ(rs[i].out.response_code, 200 + i);
                BOOST_TEST(ts[i]->state() == transfer_state::completed);
            }
        }
        BOOST_TEST_EQ(m.active(), 0u);

        // Tokens are distinct
        std::vector<transfer_token> toks;
        for (auto const& r : regs)
            toks.push_back(r.first);
        std::sort(toks.begin(), toks.end());
        BOOST_TEST(std::adjacent_find(toks.begin(), toks.end()) == toks.end());
    }

    // A queued completion for a stopped transfer is dropped
    void
    testStopWinsOverQueuedCompletion()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        transfer_token tok_a = 0;
        transfer_token tok_b = 0;
        fe.on_add = [&](transfer_token t, transfer_config const& cfg)
        {
            (url_of(cfg) == "a" ? tok_a : tok_b) = t;
            return system::error_code();
        };
        fe.on_action = [&](native_handle_type, ready_mask)
        {
            fe.complete(tok_b, {}, make_outcome(201));
        };

        transfer a({{"URL", std::string("a")}});
        transfer b({{"URL", std::string("b")}});
        result ra;
        result rb;
        capy::run_async(ioc.get_executor())(perform_task(m, a, ra));
        capy::run_async(ioc.get_executor())(perform_task(m, b, rb));
        ioc.poll();
        BOOST_TEST_EQ(m.active(), 2u);
        BOOST_TEST(!ra.done);

        // The engine finished A, but nobody has drained it yet
        fe.complete(tok_a, {}, make_outcome(200));
        fe.request_timer(std::chrono::milliseconds(0));
        BOOST_TEST(!m.stop(a));
        BOOST_TEST(a.state() == transfer_state::stopped);
        BOOST_TEST(!m.contains(a));

        ioc.run();

        BOOST_TEST_EQ(ra.resumed, 1);
        BOOST_TEST(ra.ec == error::stopped);
        BOOST_TEST_EQ(ra.out.response_code, 0);
        BOOST_TEST(a.state() == transfer_state::stopped);

        BOOST_TEST_EQ(rb.resumed, 1);
        BOOST_TEST(!rb.ec);
        BOOST_TEST_EQ(rb.out.response_code, 201);
    }

    void
    testStopOneOfTwo()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        transfer_token tok_b = 0;
        fe.on_add = [&](transfer_token t, transfer_config const& cfg)
        {
            if (url_of(cfg) == "b")
            {
                tok_b = t;
                fe.request_timer(std::chrono::milliseconds(20));
            }
            return system::error_code();
        };
        fe.on_action = [&](native_handle_type, ready_mask)
        {
            fe.complete(tok_b, {}, make_outcome(200));
        };

        transfer a({{"URL", std::string("a")}});
        transfer b({{"URL", std::string("b")}});
        result ra;
        result rb;
        capy::run_async(ioc.get_executor())(perform_task(m, a, ra));
        capy::run_async(ioc.get_executor())(perform_task(m, b, rb));

        auto stopper = [](multi& m_ref, transfer& t, result& rb_ref) -> capy::task<>
        {
            BOOST_TEST(!m_ref.stop(t));
            BOOST_TEST(!rb_ref.done);
            co_return;
        };
        capy::run_async(ioc.get_executor())(stopper(m, a, rb));
        ioc.run();

        BOOST_TEST(ra.ec == error::stopped);
        BOOST_TEST(!rb.ec);
        BOOST_TEST_EQ(rb.out.response_code, 200);
        BOOST_TEST(b.state() == transfer_state::completed);
    }

    // Cancelling the awaiting task unregisters before it resumes
    void
    testCancelNoLeak()
    {
        io_context ioc;
        pipe_fds p;
        pipe_fds q;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        transfer_token tok_c = 0;
        transfer_token tok_d = 0;
        fe.on_add = [&](transfer_token t, transfer_config const& cfg)
        {
            if (url_of(cfg) == "c")
            {
                tok_c = t;
                fe.request_socket(p.rd, socket_interest::want_read);
            }
            else
            {
                tok_d = t;
                fe.request_socket(q.rd, socket_interest::want_read);
            }
            return system::error_code();
        };
        fe.on_remove = [&](transfer_token t)
        {
            if (t == tok_c)
                fe.request_socket(p.rd, socket_interest::remove);
        };

        std::vector<native_handle_type> seen;
        fe.on_action = [&](native_handle_type fd, ready_mask)
        {
            seen.push_back(fd);
            BOOST_TEST(!fe.running(tok_c));
            fe.request_socket(q.rd, socket_interest::remove);
            fe.complete(tok_d, {}, make_outcome(200));
        };

        std::stop_source src;
        transfer c({{"URL", std::string("c")}});
        result rc;
        capy::run_async(ioc.get_executor(), src.get_token())(perform_task(m, c, rc));
        ioc.poll();
        BOOST_TEST(m.contains(c));
        BOOST_TEST(!rc.done);

        src.request_stop();

        // Unregistered synchronously, resumed later
        BOOST_TEST(!m.contains(c));
        BOOST_TEST_EQ(m.active(), 0u);
        BOOST_TEST(!fe.running(tok_c));
        BOOST_TEST(std::find(fe.removed().begin(), fe.removed().end(), tok_c)
            != fe.removed().end());
        BOOST_TEST(c.state() == transfer_state::stopped);
        BOOST_TEST(!rc.done);

        // Both pipes readable; only D's descriptor is still watched
        BOOST_TEST_EQ(::write(p.wr, "x", 1), 1);
        BOOST_TEST_EQ(::write(q.wr, "x", 1), 1);

        transfer d({{"URL", std::string("d")}});
        result rd;
        capy::run_async(ioc.get_executor())(perform_task(m, d, rd));
        ioc.run();

        BOOST_TEST_EQ(rc.resumed, 1);
        BOOST_TEST(rc.ec == capy::cond::canceled);
        BOOST_TEST(!rd.ec);
        BOOST_TEST_EQ(seen.size(), 1u);
        BOOST_TEST(std::find(seen.begin(), seen.end(), p.rd) == seen.end());
    }

    void
    testCancelBeforeRegistration()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        std::stop_source src;
        src.request_stop();

        transfer t({{"URL", std::string("x")}});
        result r;
        capy::run_async(ioc.get_executor(), src.get_token())(perform_task(m, t, r));
        ioc.run();

        BOOST_TEST(r.done);
        BOOST_TEST(r.ec == capy::cond::canceled);
        BOOST_TEST(fe.added().empty());
        BOOST_TEST(t.state() == transfer_state::idle);
    }

    void
    testAlreadyCompleted()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        transfer_token tok = 0;
        fe.on_add = [&](transfer_token t, transfer_config const&)
        {
            tok = t;
            fe.request_timer(std::chrono::milliseconds(0));
            return system::error_code();
        };
        fe.on_action = [&](native_handle_type, ready_mask)
        {
            fe.complete(tok, {}, make_outcome(200));
        };

        transfer t({{"URL", std::string("x")}});
        system::error_code ec1;
        system::error_code ec2;
        auto task = [](multi& m_ref, transfer& t_ref,
            system::error_code& e1, system::error_code& e2) -> capy::task<>
        {
            auto op = m_ref.perform(t_ref);
            auto [a, out] = co_await op;
            e1 = a;
            auto [b, out2] = co_await op;
            e2 = b;
            (void)out;
            (void)out2;
        };
        capy::run_async(ioc.get_executor())(task(m, t, ec1, ec2));
        ioc.run();

        BOOST_TEST(!ec1);
        BOOST_TEST(ec2 == error::already_completed);
        BOOST_TEST_EQ(fe.added().size(), 1u);
    }

    void
    testAlreadyRegistered()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));
        auto e2 = std::make_unique<test::fake_engine>();
        auto& fe2 = *e2;
        multi m2(ioc, std::move(e2));

        transfer t({{"URL", std::string("x")}});
        result r1;
        result r2;
        result r3;
        capy::run_async(ioc.get_executor())(perform_task(m, t, r1));
        ioc.poll();

        capy::run_async(ioc.get_executor())(perform_task(m, t, r2));
        capy::run_async(ioc.get_executor())(perform_task(m2, t, r3));
        ioc.poll();

        BOOST_TEST(r2.ec == error::already_registered);
        BOOST_TEST(r3.ec == error::already_registered);
        BOOST_TEST_EQ(fe.added().size(), 1u);
        BOOST_TEST(fe2.added().empty());
        BOOST_TEST(t.registered());

        // Another coordinator does not know it
        BOOST_TEST(!m2.contains(t));
        BOOST_TEST(m2.stop(t) == error::not_registered);

        BOOST_TEST(!m.stop(t));
        ioc.run();
        BOOST_TEST(r1.ec == error::stopped);
    }

    void
    testNotRegistered()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        transfer t({{"URL", std::string("x")}});
        BOOST_TEST(m.stop(t) == error::not_registered);
        BOOST_TEST(m.pause(t, pause_mask::all) == error::not_registered);
        BOOST_TEST(m.resume(t) == error::not_registered);
        BOOST_TEST(fe.pauses().empty());
        BOOST_TEST(t.state() == transfer_state::idle);
    }

    void
    testEngineRejected()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        fe.on_add = [&](transfer_token, transfer_config const&)
        {
            return system::error_code(48, curl_category());
        };

        transfer t({{"NO_SUCH_OPTION", 1L}});
        result r;
        capy::run_async(ioc.get_executor())(perform_task(m, t, r));
        ioc.run();

        BOOST_TEST(r.done);
        BOOST_TEST(r.ec == error::engine_rejected);
        BOOST_TEST(t.state() == transfer_state::failed);
        BOOST_TEST(t.error() == system::error_code(48, curl_category()));
        BOOST_TEST_EQ(t.token(), 0u);
        BOOST_TEST_EQ(m.active(), 0u);
        BOOST_TEST(fe.added().empty());
    }

    void
    testConfigLockedWhileRegistered()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        multi m(ioc, std::move(e));

        transfer t({{"URL", std::string("x")}});
        result r;
        capy::run_async(ioc.get_executor())(perform_task(m, t, r));
        ioc.poll();

        BOOST_TEST(t.registered());
        BOOST_TEST_THROWS(
            t.set_option("URL", std::string("y")),
            std::logic_error);
        BOOST_TEST_THROWS(
            t.set_config({{"URL", std::string("y")}}),
            std::logic_error);
        BOOST_TEST(std::get<std::string>(*t.config().find("URL")) == "x");

        BOOST_TEST(!m.stop(t));
        ioc.run();

        t.set_option("URL", std::string("y"));
        BOOST_TEST(std::get<std::string>(*t.config().find("URL")) == "y");
    }

    void
    testPerformAgain()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        std::vector<transfer_token> toks;
        fe.on_add = [&](transfer_token t, transfer_config const&)
        {
            toks.push_back(t);
            fe.request_timer(std::chrono::milliseconds(0));
            return system::error_code();
        };
        fe.on_action = [&](native_handle_type, ready_mask)
        {
            fe.complete(toks.back(), {}, make_outcome(200));
        };

        transfer t({{"URL", std::string("x")}});
        auto task = [](multi& m_ref, transfer& t_ref) -> capy::task<>
        {
            auto [ec1, out1] = co_await m_ref.perform(t_ref);
            BOOST_TEST(!ec1);
            auto [ec2, out2] = co_await m_ref.perform(t_ref);
            BOOST_TEST(!ec2);
            BOOST_TEST_EQ(out2.response_code, 200);
        };
        capy::run_async(ioc.get_executor())(task(m, t));
        ioc.run();

        BOOST_TEST_EQ(toks.size(), 2u);
        BOOST_TEST(toks[0] != toks[1]);
        BOOST_TEST(t.state() == transfer_state::completed);
    }

    void
    testPauseResume()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        transfer t({{"URL", std::string("x")}});
        result r;
        capy::run_async(ioc.get_executor())(perform_task(m, t, r));
        ioc.poll();

        auto tok = t.token();
        BOOST_TEST(!m.pause(t, pause_mask::recv));
        BOOST_TEST(!m.pause(t, pause_mask::all));
        BOOST_TEST(!m.resume(t));

        // Pausing neither resolves nor unregisters
        BOOST_TEST(t.registered());
        BOOST_TEST(m.contains(t));
        BOOST_TEST(!r.done);

        BOOST_TEST_EQ(fe.pauses().size(), 3u);
        BOOST_TEST_EQ(fe.pauses()[0].first, tok);
        BOOST_TEST(fe.pauses()[0].second == pause_mask::recv);
        BOOST_TEST(fe.pauses()[1].second == pause_mask::all);
        BOOST_TEST(fe.pauses()[2].second == pause_mask::cont);

        BOOST_TEST(!m.stop(t));
        ioc.run();
        BOOST_TEST(r.ec == error::stopped);
    }

    void
    testSetOption()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        BOOST_TEST(!m.set_option("MAXCONNECTS", 4L));
        BOOST_TEST(m.set_option("SOCKETFUNCTION", 0L) == error::reserved_option);
        BOOST_TEST(m.set_option("TIMERDATA", 0L) == error::reserved_option);
        BOOST_TEST_EQ(fe.options().size(), 1u);
        BOOST_TEST_EQ(fe.options()[0], "MAXCONNECTS");
    }

    // A descriptor the reactor refuses fails every transfer
    void
    testSubscriptionFailed()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        int bad = ::open("/proc/self/exe", O_RDONLY | O_CLOEXEC);
        BOOST_TEST(bad >= 0);

        fe.on_add = [&](transfer_token, transfer_config const& cfg)
        {
            if (url_of(cfg) == "bad")
                fe.request_socket(bad, socket_interest::want_read);
            return system::error_code();
        };

        transfer a({{"URL", std::string("ok")}});
        transfer b({{"URL", std::string("bad")}});
        result ra;
        result rb;
        capy::run_async(ioc.get_executor())(perform_task(m, a, ra));
        ioc.poll();
        BOOST_TEST(!ra.done);

        capy::run_async(ioc.get_executor())(perform_task(m, b, rb));
        ioc.run();

        BOOST_TEST(ra.ec == error::subscription_failed);
        BOOST_TEST(rb.ec == error::subscription_failed);
        BOOST_TEST(a.state() == transfer_state::failed);
        BOOST_TEST(b.state() == transfer_state::failed);
        BOOST_TEST_EQ(m.active(), 0u);
        BOOST_TEST_EQ(fe.running_count(), 0u);
        ::close(bad);
    }

    // Stopped from inside the engine; withdrawn once it returns
    void
    testStopInsideEngineCall()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        transfer_token tok = 0;
        fe.on_add = [&](transfer_token t, transfer_config const&)
        {
            tok = t;
            fe.request_timer(std::chrono::milliseconds(0));
            return system::error_code();
        };

        bool in_action = false;
        int removed_in_action = 0;
        fe.on_remove = [&](transfer_token)
        {
            if (in_action)
                ++removed_in_action;
        };

        transfer a({{"URL", std::string("a")}});
        system::error_code stop_ec = error::not_registered;
        fe.on_action = [&](native_handle_type, ready_mask)
        {
            in_action = true;
            stop_ec = m.stop(a);
            BOOST_TEST(!m.contains(a));
            BOOST_TEST(a.state() == transfer_state::stopped);
            BOOST_TEST(fe.running(tok));
            BOOST_TEST(m.stop(a) == error::not_registered);
            in_action = false;
        };

        result r;
        capy::run_async(ioc.get_executor())(perform_task(m, a, r));
        ioc.run();

        BOOST_TEST(!stop_ec);
        BOOST_TEST_EQ(removed_in_action, 0);
        BOOST_TEST_EQ(fe.removed().size(), 1u);
        BOOST_TEST_EQ(fe.removed()[0], tok);
        BOOST_TEST(!fe.running(tok));
        BOOST_TEST_EQ(r.resumed, 1);
        BOOST_TEST(r.ec == error::stopped);
        BOOST_TEST_EQ(m.active(), 0u);
    }

    void
    testCancelInsideEngineCall()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        transfer_token tok = 0;
        fe.on_add = [&](transfer_token t, transfer_config const&)
        {
            tok = t;
            fe.request_timer(std::chrono::milliseconds(0));
            return system::error_code();
        };

        bool in_action = false;
        int removed_in_action = 0;
        fe.on_remove = [&](transfer_token)
        {
            if (in_action)
                ++removed_in_action;
        };

        std::stop_source src;
        transfer c({{"URL", std::string("c")}});
        fe.on_action = [&](native_handle_type, ready_mask)
        {
            in_action = true;
            src.request_stop();
            BOOST_TEST(!m.contains(c));
            BOOST_TEST(fe.running(tok));
            in_action = false;
        };

        result r;
        capy::run_async(ioc.get_executor(), src.get_token())(perform_task(m, c, r));
        ioc.run();

        BOOST_TEST_EQ(removed_in_action, 0);
        BOOST_TEST_EQ(fe.removed().size(), 1u);
        BOOST_TEST(!fe.running(tok));
        BOOST_TEST_EQ(r.resumed, 1);
        BOOST_TEST(r.ec == capy::cond::canceled);
        BOOST_TEST(c.state() == transfer_state::stopped);
    }

    void
    testShutdownInsideEngineCall()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        fe.on_add = [&](transfer_token, transfer_config const& cfg)
        {
            if (url_of(cfg) == "b")
                fe.request_timer(std::chrono::milliseconds(20));
            return system::error_code();
        };

        bool in_action = false;
        int removed_in_action = 0;
        fe.on_remove = [&](transfer_token)
        {
            if (in_action)
                ++removed_in_action;
        };
        fe.on_action = [&](native_handle_type, ready_mask)
        {
            in_action = true;
            m.shutdown();
            BOOST_TEST_EQ(m.active(), 0u);
            BOOST_TEST_EQ(fe.running_count(), 2u);
            in_action = false;
        };

        transfer a({{"URL", std::string("a")}});
        transfer b({{"URL", std::string("b")}});
        result ra;
        result rb;
        capy::run_async(ioc.get_executor())(perform_task(m, a, ra));
        capy::run_async(ioc.get_executor())(perform_task(m, b, rb));
        ioc.run();

        BOOST_TEST_EQ(removed_in_action, 0);
        BOOST_TEST_EQ(fe.removed().size(), 2u);
        BOOST_TEST_EQ(fe.running_count(), 0u);
        BOOST_TEST(ra.ec == error::stopped);
        BOOST_TEST(rb.ec == error::stopped);
        BOOST_TEST_EQ(ra.resumed, 1);
        BOOST_TEST_EQ(rb.resumed, 1);
    }

    // Refused during an action rather than a registration
    void
    testSubscriptionFailedInsideEngineCall()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        int bad = ::open("/proc/self/exe", O_RDONLY | O_CLOEXEC);
        BOOST_TEST(bad >= 0);

        fe.on_add = [&](transfer_token, transfer_config const& cfg)
        {
            if (url_of(cfg) == "b")
                fe.request_timer(std::chrono::milliseconds(20));
            return system::error_code();
        };

        bool in_action = false;
        int removed_in_action = 0;
        fe.on_remove = [&](transfer_token)
        {
            if (in_action)
                ++removed_in_action;
        };
        fe.on_action = [&](native_handle_type fd, ready_mask)
        {
            BOOST_TEST_EQ(fd, no_descriptor);
            in_action = true;
            fe.request_socket(bad, socket_interest::want_read);

            // Resolved once the action returns
            BOOST_TEST_EQ(m.active(), 2u);
            in_action = false;
        };

        transfer a({{"URL", std::string("a")}});
        transfer b({{"URL", std::string("b")}});
        result ra;
        result rb;
        capy::run_async(ioc.get_executor())(perform_task(m, a, ra));
        capy::run_async(ioc.get_executor())(perform_task(m, b, rb));
        ioc.run();

        BOOST_TEST_EQ(fe.actions().size(), 1u);
        BOOST_TEST_EQ(removed_in_action, 0);
        BOOST_TEST(ra.ec == error::subscription_failed);
        BOOST_TEST(rb.ec == error::subscription_failed);
        BOOST_TEST(a.state() == transfer_state::failed);
        BOOST_TEST(b.state() == transfer_state::failed);
        BOOST_TEST_EQ(m.active(), 0u);
        BOOST_TEST_EQ(fe.running_count(), 0u);
        ::close(bad);
    }

    void
    testDestroyRegisteredTransfer()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        auto t = std::make_unique<transfer>(
            transfer_config{{"URL", std::string("x")}});
        result r;
        capy::run_async(ioc.get_executor())(perform_task(m, *t, r));
        ioc.poll();
        BOOST_TEST(t->registered());

        auto tok = t->token();
        t.reset();
        BOOST_TEST_EQ(m.active(), 0u);
        BOOST_TEST(!fe.running(tok));
        BOOST_TEST(!r.done);

        ioc.run();
        BOOST_TEST_EQ(r.resumed, 1);
        BOOST_TEST(r.ec == error::stopped);
    }

    void
    testShutdown()
    {
        io_context ioc;
        auto e = std::make_unique<test::fake_engine>();
        auto& fe = *e;
        multi m(ioc, std::move(e));

        transfer a({{"URL", std::string("a")}});
        transfer b({{"URL", std::string("b")}});
        result ra;
        result rb;
        capy::run_async(ioc.get_executor())(perform_task(m, a, ra));
        capy::run_async(ioc.get_executor())(perform_task(m, b, rb));
        ioc.poll();
        BOOST_TEST_EQ(m.active(), 2u);

        m.shutdown();
        m.shutdown();
        BOOST_TEST_EQ(m.active(), 0u);
        BOOST_TEST_EQ(fe.running_count(), 0u);
        ioc.run();

        BOOST_TEST(ra.ec == error::stopped);
        BOOST_TEST(rb.ec == error::stopped);
        BOOST_TEST_EQ(ra.resumed, 1);
        BOOST_TEST_EQ(rb.resumed, 1);

        // Still usable
        fe.on_add = [&](transfer_token t, transfer_config const&)
        {
            fe.complete(t, {}, make_outcome(200));
            fe.request_timer(std::chrono::milliseconds(0));
            return system::error_code();
        };
        ioc.restart();
        result rc;
        capy::run_async(ioc.get_executor())(perform_task(m, a, rc));
        ioc.run();
        BOOST_TEST(!rc.ec);
        BOOST_TEST_EQ(rc.out.response_code, 200);
    }

    void
    testDestroyStops()
    {
        io_context ioc;
        std::optional<multi> m;
        m.emplace(ioc, std::make_unique<test::fake_engine>());

        transfer t({{"URL", std::string("x")}});
        result r;
        capy::run_async(ioc.get_executor())(perform_task(*m, t, r));
        ioc.poll();
        BOOST_TEST(t.registered());

        m.reset();
        BOOST_TEST(t.state() == transfer_state::stopped);
        ioc.run();
        BOOST_TEST(r.ec == error::stopped);
    }

    void
    testMove()
    {
        io_context ioc1;
        io_context ioc2;
        multi m1(ioc1, std::make_unique<test::fake_engine>());
        multi m2(std::move(m1));
        BOOST_TEST(m2.version().find("fake") != std::string::npos);

        multi m3(ioc2, std::make_unique<test::fake_engine>());
        BOOST_TEST_THROWS(m3 = std::move(m2), std::logic_error);
    }

    void
    run()
    {
        testNullEngineThrows();
        testVersion();
        testTimerFiresFirst();
        testSocketReadiness();
        testTimerReplaced();
        testTimerCancelled();
        testIsolation();
        testStopWinsOverQueuedCompletion();
        testStopOneOfTwo();
        testCancelNoLeak();
        testCancelBeforeRegistration();
        testAlreadyCompleted();
        testAlreadyRegistered();
        testNotRegistered();
        testEngineRejected();
        testConfigLockedWhileRegistered();
        testPerformAgain();
        testPauseResume();
        testSetOption();
        testSubscriptionFailed();
        testStopInsideEngineCall();
        testCancelInsideEngineCall();
        testShutdownInsideEngineCall();
        testSubscriptionFailedInsideEngineCall();
        testDestroyRegisteredTransfer();
        testShutdown();
        testDestroyStops();
        testMove();
    }
};

} // namespace boost::corocurl

int
main()
{
    boost::corocurl::multi_test().run();
    return boost::report_errors();
}
