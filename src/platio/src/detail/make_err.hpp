//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef SRC_DETAIL_MAKE_ERR_HPP
#define SRC_DETAIL_MAKE_ERR_HPP

#include <boost/platio/detail/config.hpp>
#include <boost/system/error_code.hpp>

namespace boost::platio::detail {

/** Convert a POSIX errno value to system::error_code.

    The result is always in the system category, so locally
    detected conditions compare the same way as kernel reported
    ones against `system::errc` values.

    @param errn The errno value.
    @return The corresponding system::error_code.
*/
system::error_code make_err(int errn) noexcept;

/** Return the error for the calling thread's current errno. */
system::error_code last_err() noexcept;

} // namespace boost::platio::detail

#endif
