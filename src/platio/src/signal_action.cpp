//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#include <boost/platio/signal_action.hpp>
#include <boost/platio/detail/zeroed.hpp>

#include <type_traits>
#include <utility>

#include <signal.h>

namespace boost::platio {

namespace {

using native_flags = decltype(std::declval<struct ::sigaction>().sa_flags);

// glibc stores the flags in an int, so SA_RESETHAND reads back
// negative; widen through the unsigned type to keep bit 31 alone.
signal_action::flags_t
from_native_flags(native_flags f) noexcept
{
    using unsigned_flags = std::make_unsigned_t<native_flags>;
    return static_cast<signal_action::flags_t>(
        static_cast<signal_action::flags_type>(
            static_cast<unsigned_flags>(f)));
}

native_flags
to_native_flags(signal_action::flags_t f) noexcept
{
    return static_cast<native_flags>(
        static_cast<signal_action::flags_type>(f));
}

} // namespace

signal_action::
signal_action(
    handler_type handler,
    flags_t flags,
    signal_set const& mask) noexcept
    : sa_(detail::zeroed<struct ::sigaction>())
{
    sa_.sa_handler = handler;
    sa_.sa_mask = mask.native();
    sa_.sa_flags = to_native_flags(flags);
}

signal_action::
signal_action(
    info_handler_type handler,
    flags_t flags,
    signal_set const& mask) noexcept
    : sa_(detail::zeroed<struct ::sigaction>())
{
    sa_.sa_sigaction = handler;
    sa_.sa_mask = mask.native();
    sa_.sa_flags = to_native_flags(flags | siginfo);
}

signal_action
signal_action::
ignore()
{
    return signal_action(SIG_IGN, none, signal_set::empty());
}

signal_action
signal_action::
defaults()
{
    return signal_action(SIG_DFL, none, signal_set::empty());
}

signal_action::flags_t
signal_action::
flags() const noexcept
{
    return from_native_flags(sa_.sa_flags);
}

signal_action::handler_type
signal_action::
handler() const noexcept
{
    if (uses_info())
        return nullptr;
    return sa_.sa_handler;
}

signal_action::info_handler_type
signal_action::
info_handler() const noexcept
{
    if (!uses_info())
        return nullptr;
    return sa_.sa_sigaction;
}

} // namespace boost::platio
