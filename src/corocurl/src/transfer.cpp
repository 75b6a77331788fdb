//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#include <boost/corocurl/transfer.hpp>
#include <boost/corocurl/detail/except.hpp>

#include "src/detail/multi_service.hpp"

#include <algorithm>

namespace boost::corocurl {

transfer_config::
transfer_config(std::initializer_list<value_type> init)
{
    for (auto const& v : init)
        set(v.first, v.second);
}

void
transfer_config::
set(std::string_view name, option_value v)
{
    auto it = std::find_if(opts_.begin(), opts_.end(),
        [name](value_type const& e) { return e.first == name; });
    if (it != opts_.end())
    {
        it->second = std::move(v);
        return;
    }
    opts_.emplace_back(std::string(name), std::move(v));
}

bool
transfer_config::
erase(std::string_view name) noexcept
{
    auto it = std::find_if(opts_.begin(), opts_.end(),
        [name](value_type const& e) { return e.first == name; });
    if (it == opts_.end())
        return false;
    opts_.erase(it);
    return true;
}

option_value const*
transfer_config::
find(std::string_view name) const noexcept
{
    auto it = std::find_if(opts_.begin(), opts_.end(),
        [name](value_type const& e) { return e.first == name; });
    if (it == opts_.end())
        return nullptr;
    return &it->second;
}

//------------------------------------------------------------------------------

transfer::
transfer(transfer_config cfg) noexcept
    : cfg_(std::move(cfg))
{
}

transfer::
~transfer()
{
    if (owner_)
        owner_->detach(*this);
}

void
transfer::
set_option(std::string_view name, option_value v)
{
    if (registered())
        detail::throw_logic_error("transfer::set_option: transfer is registered");
    cfg_.set(name, std::move(v));
}

void
transfer::
set_config(transfer_config cfg)
{
    if (registered())
        detail::throw_logic_error("transfer::set_config: transfer is registered");
    cfg_ = std::move(cfg);
}

} // namespace boost::corocurl
