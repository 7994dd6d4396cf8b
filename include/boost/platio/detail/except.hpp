//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_DETAIL_EXCEPT_HPP
#define BOOST_PLATIO_DETAIL_EXCEPT_HPP

#include <boost/platio/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>

namespace boost {
namespace platio {
namespace detail {

BOOST_PLATIO_DECL void BOOST_NORETURN throw_logic_error(
    char const* what,
    source_location const& loc = BOOST_CURRENT_LOCATION);

/** Throw a system_error exception with context.

    @note Callers should check `ec.failed()` before calling this function.

    @param ec The error code to throw.
    @param what Name of the foreign call that failed.
    @param loc Source location for diagnostics.
*/
BOOST_PLATIO_DECL void BOOST_NORETURN throw_system_error(
    system::error_code const& ec,
    char const* what,
    source_location const& loc = BOOST_CURRENT_LOCATION);

} // detail
} // platio
} // boost

#endif
