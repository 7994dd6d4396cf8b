//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_SIGNAL_HPP
#define BOOST_PLATIO_SIGNAL_HPP

#include <boost/platio/detail/config.hpp>
#include <boost/platio/detail/platform_signals.hpp>
#include <boost/platio/signal_action.hpp>
#include <boost/platio/signal_info.hpp>
#include <boost/platio/signal_set.hpp>
#include <boost/platio/signals.hpp>
#include <boost/platio/thread_id.hpp>
#include <boost/system/result.hpp>

#include <chrono>

#include <sys/types.h>

/*
    Signal Control
    ==============

    Synchronous wrappers over the POSIX signal calls. Nothing here
    creates threads, queues signals or dispatches handlers.

    Error reporting follows each call's own convention:

      install_action, query_action   sigaction        -1 and errno
      send_to_process                kill             -1 and errno
      wait, wait_for                 sigwaitinfo,     -1 and errno
                                     sigtimedwait
      pending                        sigpending       -1 and errno
      set_thread_mask, thread_mask   pthread_sigmask  error number returned
      send_to_thread                 pthread_kill     error number returned

    The pthread functions never touch errno; their result is the
    error.
*/

namespace boost {
namespace platio {

/** How `set_thread_mask` combines the given set with the current mask. */
enum class mask_how : int
{
    /// Add the signals in the set to the mask (SIG_BLOCK).
    block = detail::platform_signals::sig_block,

    /// Remove the signals in the set from the mask (SIG_UNBLOCK).
    unblock = detail::platform_signals::sig_unblock,

    /// Replace the mask with the set (SIG_SETMASK).
    set = detail::platform_signals::sig_setmask
};

/** Install the action for a signal.

    @param signal_number The signal whose disposition changes.
    @param action The action to install.

    @return The action in effect before the call, which can be
        installed again to restore it. Fails with
        `errc::invalid_argument` for an invalid signal number or
        for SIGKILL and SIGSTOP.
*/
BOOST_PLATIO_DECL
system::result<signal_action>
install_action(int signal_number, signal_action const& action);

/** Return the action currently installed for a signal.

    @param signal_number The signal to query.
*/
BOOST_PLATIO_DECL
system::result<signal_action>
query_action(int signal_number);

/** Change the calling thread's signal mask.

    @param how How `set` is combined with the current mask.
    @param set The signals to block, unblock or use as the mask.

    @return The mask in effect before the call.
*/
BOOST_PLATIO_DECL
system::result<signal_set>
set_thread_mask(mask_how how, signal_set const& set);

/// Return the calling thread's signal mask.
BOOST_PLATIO_DECL
system::result<signal_set>
thread_mask();

/** Send a signal to a process.

    @param pid The target process, or a process group as
        described for `kill`.
    @param signal_number The signal to send. Zero performs the
        permission and existence checks only.
*/
BOOST_PLATIO_DECL
system::result<void>
send_to_process(::pid_t pid, int signal_number);

/** Send a signal to a thread of the calling process.

    @param tid The target thread.
    @param signal_number The signal to send.
*/
BOOST_PLATIO_DECL
system::result<void>
send_to_thread(thread_id tid, int signal_number);

/** Wait for a signal in a set and consume it.

    The signals in `set` must be blocked in the calling thread,
    otherwise they may be delivered to a handler instead.

    @par Warning
    There is no way to abort this wait other than delivering one
    of the signals in `set`. Use `wait_for` when the caller needs
    to regain control.

    @param set The signals to wait for.

    @return Information about the consumed signal, or
        `errc::interrupted` if a handler for a signal outside
        `set` ran.
*/
BOOST_PLATIO_DECL
system::result<signal_info>
wait(signal_set const& set);

/** Wait for a signal in a set, with a time limit.

    @param set The signals to wait for.
    @param timeout The longest time to block. Zero or negative
        values poll without blocking.

    @return Information about the consumed signal, or
        `errc::timed_out` if none arrived in time.
*/
BOOST_PLATIO_DECL
system::result<signal_info>
wait_for(signal_set const& set, std::chrono::nanoseconds timeout);

/// Return the signals pending for the calling thread or process.
BOOST_PLATIO_DECL
system::result<signal_set>
pending();

} // namespace platio
} // namespace boost

#endif
