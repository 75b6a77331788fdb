//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_SRC_DETAIL_INTRUSIVE_HPP
#define BOOST_COROCURL_SRC_DETAIL_INTRUSIVE_HPP

namespace boost::corocurl::detail {

/** An intrusive doubly linked list.

    Services use this to track the implementations they own, so
    that shutdown can reach every live object and release can
    unlink one in constant time.

    @tparam T The element type. Must derive from `intrusive_list<T>::node`.
*/
template<class T>
class intrusive_list
{
public:
    /** Base class for list elements. */
    class node
    {
        friend class intrusive_list;

    private:
        T* next_ = nullptr;
        T* prev_ = nullptr;
    };

private:
    T* head_ = nullptr;
    T* tail_ = nullptr;

public:
    intrusive_list() = default;

    intrusive_list(intrusive_list const&) = delete;
    intrusive_list& operator=(intrusive_list const&) = delete;

    bool
    empty() const noexcept
    {
        return head_ == nullptr;
    }

    T*
    front() const noexcept
    {
        return head_;
    }

    void
    push_back(T* w) noexcept
    {
        w->next_ = nullptr;
        w->prev_ = tail_;
        if(tail_)
            tail_->next_ = w;
        else
            head_ = w;
        tail_ = w;
    }

    T*
    pop_front() noexcept
    {
        if(!head_)
            return nullptr;
        T* w = head_;
        head_ = head_->next_;
        if(head_)
            head_->prev_ = nullptr;
        else
            tail_ = nullptr;
        return w;
    }

    void
    remove(T* w) noexcept
    {
        if(w->prev_)
            w->prev_->next_ = w->next_;
        else
            head_ = w->next_;
        if(w->next_)
            w->next_->prev_ = w->prev_;
        else
            tail_ = w->prev_;
        w->next_ = nullptr;
        w->prev_ = nullptr;
    }
};

} // namespace boost::corocurl::detail

#endif
