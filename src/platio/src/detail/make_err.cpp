//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#include "src/detail/make_err.hpp"

#include <boost/system/system_category.hpp>

#include <errno.h>

namespace boost::platio::detail {

system::error_code
make_err(int errn) noexcept
{
    if (errn == 0)
        return {};

    return system::error_code(errn, system::system_category());
}

system::error_code
last_err() noexcept
{
    int const errn = errno;

    // A failing call that left errno clear must still fail
    if (errn == 0)
        return make_err(EINVAL);

    return make_err(errn);
}

} // namespace boost::platio::detail
