//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_SIGNAL_ACTION_HPP
#define BOOST_PLATIO_SIGNAL_ACTION_HPP

#include <boost/platio/detail/config.hpp>
#include <boost/platio/detail/platform_signals.hpp>
#include <boost/platio/signal_set.hpp>

#include <signal.h>

/*
    Signal Action
    =============

    A signal_action is a ready to install `struct sigaction`.

    1. Abstract flag names: flags_t names the behaviors (restart,
       on_stack, ...) and takes its bit values from the platform
       signal table, so the same source compiles to the right
       SA_* bits on Linux, MIPS and BSD.

    2. Handler kind and SA_SIGINFO always agree: the extended
       handler constructor ORs in `siginfo` unconditionally, so a
       three argument handler can never be installed as a one
       argument handler.

    3. The native struct is zero filled before any field is
       assigned; reserved members such as `sa_restorer` are zero.
*/

namespace boost {
namespace platio {

/** The action taken on delivery of a signal.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Safe (immutable after construction).

    @par Example
    @code
    extern "C" void on_usr1(int, siginfo_t*, void*);

    signal_action act(on_usr1, signal_action::restart, signal_set());
    auto previous = install_action(sigusr1, act).value();
    @endcode
*/
class BOOST_PLATIO_DECL signal_action
{
    struct ::sigaction sa_;

public:
    using native_type = struct ::sigaction;

    /// A handler receiving only the signal number.
    using handler_type = void (*)(int);

    /// A handler receiving the signal number, its info and context.
    using info_handler_type = void (*)(int, ::siginfo_t*, void*);

    using flags_type = detail::platform_signals::flags_type;

    /** Flags controlling how the signal is delivered.

        The values are the platform's SA_* bits. Multiple flags
        can be combined using the bitwise OR operator.
    */
    enum flags_t : flags_type
    {
        /// No special flags.
        none = 0,

        /// Don't generate SIGCHLD when children stop.
        /// Equivalent to SA_NOCLDSTOP.
        no_child_stop = detail::platform_signals::sa_nocldstop,

        /// Don't create zombie processes on child termination.
        /// Equivalent to SA_NOCLDWAIT.
        no_child_wait = detail::platform_signals::sa_nocldwait,

        /// Don't block the signal while its handler runs.
        /// Equivalent to SA_NODEFER.
        no_defer = detail::platform_signals::sa_nodefer,

        /// Run the handler on the alternate signal stack.
        /// Equivalent to SA_ONSTACK.
        on_stack = detail::platform_signals::sa_onstack,

        /// Reset handler to SIG_DFL after one invocation.
        /// Equivalent to SA_RESETHAND.
        reset_handler = detail::platform_signals::sa_resethand,

        /// Restart interrupted system calls.
        /// Equivalent to SA_RESTART.
        restart = detail::platform_signals::sa_restart,

        /// The handler takes three arguments.
        /// Equivalent to SA_SIGINFO.
        siginfo = detail::platform_signals::sa_siginfo
    };

    /// Combine two flag values.
    friend constexpr flags_t operator|(flags_t a, flags_t b) noexcept
    {
        return static_cast<flags_t>(
            static_cast<flags_type>(a) | static_cast<flags_type>(b));
    }

    /// Mask two flag values.
    friend constexpr flags_t operator&(flags_t a, flags_t b) noexcept
    {
        return static_cast<flags_t>(
            static_cast<flags_type>(a) & static_cast<flags_type>(b));
    }

    /// Compound assignment OR.
    friend constexpr flags_t& operator|=(flags_t& a, flags_t b) noexcept
    {
        return a = a | b;
    }

    /// Compound assignment AND.
    friend constexpr flags_t& operator&=(flags_t& a, flags_t b) noexcept
    {
        return a = a & b;
    }

    /// Bitwise NOT (complement).
    friend constexpr flags_t operator~(flags_t a) noexcept
    {
        return static_cast<flags_t>(~static_cast<flags_type>(a));
    }

    /** Construct an action with a plain handler.

        @param handler The handler, or `SIG_IGN` / `SIG_DFL`.
        @param flags Delivery flags. `siginfo` must not be set.
        @param mask Signals blocked while the handler runs.
    */
    signal_action(
        handler_type handler,
        flags_t flags,
        signal_set const& mask) noexcept;

    /** Construct an action with an extended handler.

        The `siginfo` flag is always added to `flags`.

        @param handler The three argument handler.
        @param flags Delivery flags.
        @param mask Signals blocked while the handler runs.
    */
    signal_action(
        info_handler_type handler,
        flags_t flags,
        signal_set const& mask) noexcept;

    /** Construct from a native action.

        The native value is copied as is. It must have been
        produced by `sigaction`.
    */
    explicit signal_action(struct ::sigaction const& native) noexcept
        : sa_(native)
    {
    }

    /// Return an action that ignores the signal.
    static signal_action ignore();

    /// Return an action that restores the default disposition.
    static signal_action defaults();

    /** Return the flags.

        Bits set by the C library itself, such as SA_RESTORER on
        Linux, are returned as well.
    */
    flags_t flags() const noexcept;

    /// Return the signals blocked while the handler runs.
    signal_set mask() const noexcept
    {
        return signal_set(sa_.sa_mask);
    }

    /// Return true if the handler is an extended handler.
    bool uses_info() const noexcept
    {
        return (flags() & siginfo) != none;
    }

    /// Return the plain handler, or null if `uses_info()`.
    handler_type handler() const noexcept;

    /// Return the extended handler, or null unless `uses_info()`.
    info_handler_type info_handler() const noexcept;

    /// Return the wrapped native struct.
    struct ::sigaction const&
    native() const noexcept
    {
        return sa_;
    }
};

} // namespace platio
} // namespace boost

#endif
