//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_DETAIL_ZEROED_HPP
#define BOOST_PLATIO_DETAIL_ZEROED_HPP

#include <cstring>
#include <type_traits>

namespace boost {
namespace platio {
namespace detail {

/** Return a native C struct with every byte set to zero.

    This is the only way the library creates the kernel facing
    structs it wraps (`sigaction`, `sigset_t`, `siginfo_t`, the
    `sockaddr_*` family and `ip_mreq`). Reserved fields and padding
    bytes are zero before any field is assigned, so no foreign call
    ever sees an indeterminate byte.
*/
template<class T>
T
zeroed() noexcept
{
    static_assert(std::is_trivially_copyable_v<T>);
    static_assert(std::is_standard_layout_v<T>);

    T t;
    std::memset(&t, 0, sizeof(T));
    return t;
}

} // detail
} // platio
} // boost

#endif
