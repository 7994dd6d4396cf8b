//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#include <boost/platio/signal_set.hpp>
#include <boost/platio/detail/except.hpp>
#include <boost/platio/detail/zeroed.hpp>

#include "src/detail/make_err.hpp"

#include <climits>

#include <signal.h>

namespace boost::platio {

#if !defined(__BIONIC__)
static_assert(
    sizeof(::sigset_t) * CHAR_BIT == detail::platform_signals::sigset_bits,
    "sigset_t width does not match the platform signal table");
#endif

signal_set::
signal_set(bool full)
    : set_(detail::zeroed<::sigset_t>())
{
    int const res = full
        ? ::sigfillset(&set_)
        : ::sigemptyset(&set_);
    if (res < 0)
        detail::throw_system_error(
            detail::last_err(), full ? "sigfillset" : "sigemptyset");
}

signal_set::
signal_set()
    : signal_set(false)
{
}

system::result<void>
signal_set::
add(int signal_number)
{
    if (::sigaddset(&set_, signal_number) < 0)
        return detail::last_err();
    return {};
}

system::result<void>
signal_set::
remove(int signal_number)
{
    if (::sigdelset(&set_, signal_number) < 0)
        return detail::last_err();
    return {};
}

system::result<bool>
signal_set::
contains(int signal_number) const
{
    int const res = ::sigismember(&set_, signal_number);
    if (res < 0)
        return {system::in_place_error, detail::last_err()};
    return res != 0;
}

} // namespace boost::platio
