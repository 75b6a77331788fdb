//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_SRC_DETAIL_SCHEDULER_OP_HPP
#define BOOST_COROCURL_SRC_DETAIL_SCHEDULER_OP_HPP

#include <boost/corocurl/detail/config.hpp>

namespace boost::corocurl::detail {

/** Abstract base class for queued completion handlers.

    Callers must invoke exactly ONE of `operator()` or `destroy()`.
    `operator()` runs the handler and is responsible for its own
    cleanup; `destroy()` discards a handler that never ran, as
    happens when the scheduler shuts down with work queued.
*/
class scheduler_op
{
    friend class op_queue;

    scheduler_op* next_ = nullptr;

public:
    virtual void operator()() = 0;
    virtual void destroy() = 0;

protected:
    ~scheduler_op() = default;
};

//------------------------------------------------------------------------------

/** An intrusive FIFO of scheduler_ops.

    Not thread-safe.
*/
class op_queue
{
    scheduler_op* head_ = nullptr;
    scheduler_op* tail_ = nullptr;

public:
    op_queue() = default;
    op_queue(op_queue const&) = delete;
    op_queue& operator=(op_queue const&) = delete;

    bool
    empty() const noexcept
    {
        return head_ == nullptr;
    }

    void
    push(scheduler_op* op) noexcept
    {
        op->next_ = nullptr;
        if(tail_)
            tail_->next_ = op;
        else
            head_ = op;
        tail_ = op;
    }

    scheduler_op*
    pop() noexcept
    {
        if(!head_)
            return nullptr;
        scheduler_op* op = head_;
        head_ = head_->next_;
        if(!head_)
            tail_ = nullptr;
        return op;
    }
};

} // namespace boost::corocurl::detail

#endif
