//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#ifndef BOOST_COROCURL_IO_OBJECT_HPP
#define BOOST_COROCURL_IO_OBJECT_HPP

#include <boost/corocurl/detail/config.hpp>
#include <boost/capy/ex/execution_context.hpp>

namespace boost::corocurl {

/** Base class for objects bound to an execution context.

    Timers and transfer coordinators derive from this class. Each
    holds a pointer to a service-owned implementation; the public
    object forwards to it and calls `release()` when destroyed,
    which hands the implementation back to its service.

    An object must be destroyed before the context it is bound to.
*/
class BOOST_COROCURL_DECL io_object
{
public:
    struct io_object_impl
    {
        virtual ~io_object_impl() = default;

        virtual void release() = 0;
    };

    /** Return the execution context this object is bound to. */
    auto
    context() const noexcept ->
        capy::execution_context&
    {
        return *ctx_;
    }

protected:
    virtual ~io_object() = default;

    explicit
    io_object(
        capy::execution_context& ctx) noexcept
        : ctx_(&ctx)
    {
    }

    io_object(io_object&& other) noexcept
        : ctx_(other.ctx_)
    {
    }

    capy::execution_context* ctx_ = nullptr;
    io_object_impl* impl_ = nullptr;
};

} // namespace boost::corocurl

#endif
