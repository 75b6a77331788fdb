//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#include <boost/corocurl/io_context.hpp>

#include "src/detail/epoll/scheduler.hpp"

namespace boost::corocurl {

io_context::
io_context()
{
    sched_ = &make_service<detail::epoll_scheduler>();
}

io_context::
~io_context()
{
    shutdown();
    destroy();
}

} // namespace boost::corocurl
