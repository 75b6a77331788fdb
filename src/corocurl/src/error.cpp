//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#include <boost/corocurl/error.hpp>

#include <curl/curl.h>

#include <string>

namespace boost::corocurl {

namespace {

class error_category_impl
    : public system::error_category
{
public:
    char const* name() const noexcept override
    {
        return "boost.corocurl";
    }

    std::string message(int ev) const override
    {
        switch (static_cast<error>(ev))
        {
        case error::engine_rejected:
            return "transfer engine rejected the transfer";
        case error::not_registered:
            return "transfer is not registered";
        case error::already_completed:
            return "operation already completed";
        case error::stopped:
            return "transfer stopped";
        case error::already_registered:
            return "transfer is already registered";
        case error::reserved_option:
            return "option is reserved for the event loop";
        case error::subscription_failed:
            return "descriptor subscription failed";
        }
        return "unknown boost.corocurl error";
    }
};

class curl_category_impl
    : public system::error_category
{
public:
    char const* name() const noexcept override
    {
        return "curl";
    }

    std::string message(int ev) const override
    {
        return ::curl_easy_strerror(static_cast<CURLcode>(ev));
    }
};

class curl_multi_category_impl
    : public system::error_category
{
public:
    char const* name() const noexcept override
    {
        return "curl.multi";
    }

    std::string message(int ev) const override
    {
        return ::curl_multi_strerror(static_cast<CURLMcode>(ev));
    }
};

} // namespace

system::error_category const&
get_error_category() noexcept
{
    static error_category_impl const cat;
    return cat;
}

system::error_category const&
curl_category() noexcept
{
    static curl_category_impl const cat;
    return cat;
}

system::error_category const&
curl_multi_category() noexcept
{
    static curl_multi_category_impl const cat;
    return cat;
}

} // namespace boost::corocurl
