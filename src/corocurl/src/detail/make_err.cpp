//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corocurl
//

#include "src/detail/make_err.hpp"

#include <boost/capy/error.hpp>
#include <boost/system/error_code.hpp>

#include <errno.h>

namespace boost::corocurl::detail {

system::error_code
make_err(int errn) noexcept
{
    if (errn == 0)
        return {};

    if (errn == ECANCELED)
        return capy::error::canceled;

    return system::error_code(errn, system::system_category());
}

} // namespace boost::corocurl::detail
