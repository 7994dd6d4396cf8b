//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_SIGNAL_INFO_HPP
#define BOOST_PLATIO_SIGNAL_INFO_HPP

#include <boost/platio/detail/config.hpp>

#include <signal.h>
#include <sys/types.h>

namespace boost {
namespace platio {

/** Information about a signal consumed by a synchronous wait.

    The fields are copied one by one out of a zero filled
    `siginfo_t`, so fields the kernel did not supply read as zero.
    Fields that the cause code does not define also read as zero.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Safe (immutable after construction).
*/
class signal_info
{
    int signal_number_ = 0;
    int error_ = 0;
    int code_ = 0;
    ::pid_t pid_ = 0;
    ::uid_t uid_ = 0;
    int status_ = 0;

    static bool
    is_child_event(::siginfo_t const& si) noexcept
    {
        return si.si_signo == SIGCHLD &&
            si.si_code >= CLD_EXITED &&
            si.si_code <= CLD_CONTINUED;
    }

    static bool
    has_sender(::siginfo_t const& si) noexcept
    {
        switch (si.si_code)
        {
        case SI_USER:
        case SI_QUEUE:
#if defined(SI_TKILL)
        case SI_TKILL:
#endif
            return true;
        default:
            return false;
        }
    }

public:
    /// Construct an empty value.
    signal_info() = default;

    /** Construct from a native value filled by the kernel.

        `siginfo_t` is a union selected by the signal and its cause.
        The sender is read only for `SI_USER`, `SI_QUEUE`, `SI_TKILL`
        and the `CLD_*` codes of SIGCHLD; the status only for the
        `CLD_*` codes. Other fields are left zero.
    */
    explicit signal_info(::siginfo_t const& si) noexcept
        : signal_number_(si.si_signo)
        , error_(si.si_errno)
        , code_(si.si_code)
    {
        if (is_child_event(si))
        {
            pid_ = si.si_pid;
            uid_ = si.si_uid;
            status_ = si.si_status;
        }
        else if (has_sender(si))
        {
            pid_ = si.si_pid;
            uid_ = si.si_uid;
        }
    }

    /// Return the signal number.
    int
    signal_number() const noexcept
    {
        return signal_number_;
    }

    /// Return the errno value associated with the signal, if any.
    int
    error() const noexcept
    {
        return error_;
    }

    /// Return the cause code (`SI_USER`, `SI_TKILL`, `CLD_EXITED`, ...).
    int
    code() const noexcept
    {
        return code_;
    }

    /// Return the sending process, or zero.
    ::pid_t
    pid() const noexcept
    {
        return pid_;
    }

    /// Return the real user id of the sender, or zero.
    ::uid_t
    uid() const noexcept
    {
        return uid_;
    }

    /// Return the exit status or signal for SIGCHLD, or zero.
    int
    status() const noexcept
    {
        return status_;
    }
};

} // namespace platio
} // namespace boost

#endif
