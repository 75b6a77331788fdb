//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_SRC_DETAIL_RESUME_CORO_HPP
#define BOOST_COROCURL_SRC_DETAIL_RESUME_CORO_HPP

#include <boost/capy/ex/executor_ref.hpp>
#include <boost/capy/coro.hpp>

namespace boost::corocurl::detail {

/** Resume a coroutine through its executor.

    Uses symmetric transfer: if dispatch returns the same handle,
    we resume directly. If it returns noop_coroutine, the work was
    posted to a queue and will be resumed by the scheduler.
*/
inline void
resume_coro(capy::executor_ref d, capy::coro h)
{
    auto resume_h = d.dispatch(h);
    if (resume_h.address() == h.address())
        resume_h.resume();
}

/** Schedule a coroutine for resumption on a later turn of its executor.

    Used where resuming inline would run user code from inside
    engine or stop-token callbacks.
*/
inline void
post_coro(capy::executor_ref d, capy::coro h)
{
    d.post(h);
}

} // namespace boost::corocurl::detail

#endif
