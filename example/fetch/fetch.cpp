//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#include <boost/corocurl.hpp>
#include <boost/capy/ex/run_async.hpp>
#include <boost/capy/task.hpp>

#include <flow/common.hpp>
#include <flow/log/config.hpp>
#include <flow/log/log.hpp>
#include <flow/log/simple_ostream_logger.hpp>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace corocurl = boost::corocurl;
namespace capy = boost::capy;

// Fetch one URL, discarding the body
capy::task<void>
do_fetch(
    corocurl::multi& m,
    corocurl::transfer& t,
    corocurl::timer& deadline,
    int& remaining,
    flow::log::Logger* logger)
{
    FLOW_LOG_SET_CONTEXT(logger, flow::Flow_log_component::S_UNCAT);

    auto const& url = std::get<std::string>(*t.config().find("URL"));
    auto [ec, out] = co_await m.perform(t);

    // The last fetch releases the deadline
    if (--remaining == 0)
        deadline.cancel();

    if (ec)
    {
        FLOW_LOG_WARNING("Fetch [" << url << "] failed: [" << ec << "] [" << ec.message() << "].");
        co_return;
    }

    FLOW_LOG_INFO("Fetch [" << url << "]: status [" << out.response_code << "], "
                  "[" << out.bytes_received << "] bytes in "
                  "[" << out.total_time.count() << "] us; final URL [" << out.effective_url << "].");
}

// Stop whatever is still running when the deadline passes
capy::task<void>
do_deadline(
    corocurl::timer& t,
    corocurl::multi& m)
{
    auto [ec] = co_await t.wait();
    if (!ec && m.active() > 0)
        m.shutdown();
}

int
main(int argc, char* argv[])
{
    using flow::log::Config;
    using flow::log::Simple_ostream_logger;
    using flow::Flow_log_component;

    if (argc < 2)
    {
        std::cerr <<
            "Usage: fetch <url> [<url> ...]\n"
            "Example:\n"
            "    fetch https://www.boost.org/ https://curl.se/\n";
        return EXIT_FAILURE;
    }

    Config log_config;
    log_config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
    log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "fetch-");

    Simple_ostream_logger logger(&log_config);
    FLOW_LOG_SET_CONTEXT(&logger, Flow_log_component::S_UNCAT);

    try
    {
        corocurl::io_context ioc;
        corocurl::multi m(ioc, &logger);
        if (auto ec = m.set_option("MAX_TOTAL_CONNECTIONS", 8L))
            FLOW_LOG_WARNING("Connection limit not applied: [" << ec << "] [" << ec.message() << "].");
        FLOW_LOG_INFO("Using [" << m.version() << "].");

        corocurl::timer deadline(ioc);
        deadline.expires_after(std::chrono::seconds(30));
        capy::run_async(ioc.get_executor())(do_deadline(deadline, m));

        int remaining = argc - 1;
        std::vector<std::unique_ptr<corocurl::transfer>> transfers;
        for (int i = 1; i < argc; ++i)
        {
            transfers.push_back(std::make_unique<corocurl::transfer>(
                corocurl::transfer_config{
                    {"URL", std::string(argv[i])},
                    {"FOLLOWLOCATION", 1L},
                    {"CONNECTTIMEOUT_MS", 10000L}}));
            capy::run_async(ioc.get_executor())(
                do_fetch(m, *transfers.back(), deadline, remaining, &logger));
        }

        ioc.run();
    }
    catch (std::exception const& e)
    {
        FLOW_LOG_WARNING("Caught exception: [" << e.what() << "].");
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
