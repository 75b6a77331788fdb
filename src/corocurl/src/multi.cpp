//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#include <boost/corocurl/multi.hpp>
#include <boost/corocurl/curl_engine.hpp>
#include <boost/corocurl/detail/except.hpp>

#include "src/detail/multi_service.hpp"

namespace boost::corocurl {

namespace {

detail::multi_service&
find_multi_service(capy::execution_context& ctx)
{
    auto* svc = ctx.find_service<detail::multi_service>();
    if (!svc)
        detail::throw_logic_error("multi: context has no transfer service");
    return *svc;
}

} // namespace

multi::
~multi()
{
    if (impl_)
        impl_->release();
}

multi::
multi(
    capy::execution_context& ctx,
    flow::log::Logger* logger)
    : multi(ctx, std::make_unique<curl_engine>(), logger)
{
}

multi::
multi(
    capy::execution_context& ctx,
    std::unique_ptr<engine> e,
    flow::log::Logger* logger)
    : io_object(ctx)
{
    if (!e)
        detail::throw_logic_error("multi: null engine");
    impl_ = &find_multi_service(ctx).create_impl(std::move(e), logger);
}

multi::
multi(multi&& other) noexcept
    : io_object(std::move(other))
{
    impl_ = other.impl_;
    other.impl_ = nullptr;
}

multi&
multi::
operator=(multi&& other)
{
    if (this != &other)
    {
        if (ctx_ != other.ctx_)
            detail::throw_logic_error("multi::operator=: context mismatch");

        if (impl_)
            impl_->release();

        impl_ = other.impl_;
        other.impl_ = nullptr;
    }
    return *this;
}

system::error_code
multi::
stop(transfer& t)
{
    return get().stop(t);
}

system::error_code
multi::
pause(transfer& t, pause_mask mask)
{
    return get().pause(t, mask);
}

system::error_code
multi::
set_option(std::string_view name, option_value const& v)
{
    return get().set_option(name, v);
}

void
multi::
shutdown()
{
    get().shutdown();
}

std::size_t
multi::
active() const noexcept
{
    return get().active();
}

bool
multi::
contains(transfer const& t) const noexcept
{
    return get().contains(t);
}

std::string
multi::
version() const
{
    return get().version();
}

} // namespace boost::corocurl
