//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_SIGNALS_HPP
#define BOOST_PLATIO_SIGNALS_HPP

#include <boost/platio/detail/config.hpp>
#include <boost/platio/detail/platform_signals.hpp>

/*
    Signal Numbers
    ==============

    Symbolic signal numbers for the target platform. The values
    come from the single signal table chosen at build time in
    detail/platform_signals.hpp, and the library sources check
    each one against <signal.h>.

    Signals that exist only on some platforms are guarded:

      BOOST_PLATIO_HAS_SIGEMT     - MIPS Linux, BSD
      BOOST_PLATIO_HAS_SIGINFO    - BSD
      BOOST_PLATIO_HAS_SIGPOLL    - Linux
      BOOST_PLATIO_HAS_SIGPWR     - Linux
      BOOST_PLATIO_HAS_SIGSTKFLT  - Linux on x86, ARM
*/

#if defined(BOOST_PLATIO_SIGNALS_LINUX_GENERIC)
# define BOOST_PLATIO_HAS_SIGPOLL 1
# define BOOST_PLATIO_HAS_SIGPWR 1
# define BOOST_PLATIO_HAS_SIGSTKFLT 1
#elif defined(BOOST_PLATIO_SIGNALS_LINUX_MIPS)
# define BOOST_PLATIO_HAS_SIGEMT 1
# define BOOST_PLATIO_HAS_SIGPOLL 1
# define BOOST_PLATIO_HAS_SIGPWR 1
#elif defined(BOOST_PLATIO_SIGNALS_BSD)
# define BOOST_PLATIO_HAS_SIGEMT 1
# define BOOST_PLATIO_HAS_SIGINFO 1
#endif

namespace boost {
namespace platio {

inline constexpr int sighup    = detail::platform_signals::sighup;
inline constexpr int sigint    = detail::platform_signals::sigint;
inline constexpr int sigquit   = detail::platform_signals::sigquit;
inline constexpr int sigill    = detail::platform_signals::sigill;
inline constexpr int sigtrap   = detail::platform_signals::sigtrap;
inline constexpr int sigabrt   = detail::platform_signals::sigabrt;
inline constexpr int sigiot    = detail::platform_signals::sigiot;
inline constexpr int sigbus    = detail::platform_signals::sigbus;
inline constexpr int sigfpe    = detail::platform_signals::sigfpe;
inline constexpr int sigkill   = detail::platform_signals::sigkill;
inline constexpr int sigusr1   = detail::platform_signals::sigusr1;
inline constexpr int sigsegv   = detail::platform_signals::sigsegv;
inline constexpr int sigusr2   = detail::platform_signals::sigusr2;
inline constexpr int sigpipe   = detail::platform_signals::sigpipe;
inline constexpr int sigalrm   = detail::platform_signals::sigalrm;
inline constexpr int sigterm   = detail::platform_signals::sigterm;
inline constexpr int sigchld   = detail::platform_signals::sigchld;
inline constexpr int sigcont   = detail::platform_signals::sigcont;
inline constexpr int sigstop   = detail::platform_signals::sigstop;
inline constexpr int sigtstp   = detail::platform_signals::sigtstp;
inline constexpr int sigttin   = detail::platform_signals::sigttin;
inline constexpr int sigttou   = detail::platform_signals::sigttou;
inline constexpr int sigurg    = detail::platform_signals::sigurg;
inline constexpr int sigxcpu   = detail::platform_signals::sigxcpu;
inline constexpr int sigxfsz   = detail::platform_signals::sigxfsz;
inline constexpr int sigvtalrm = detail::platform_signals::sigvtalrm;
inline constexpr int sigprof   = detail::platform_signals::sigprof;
inline constexpr int sigwinch  = detail::platform_signals::sigwinch;
inline constexpr int sigio     = detail::platform_signals::sigio;
inline constexpr int sigsys    = detail::platform_signals::sigsys;

#if defined(BOOST_PLATIO_HAS_SIGEMT)
inline constexpr int sigemt    = detail::platform_signals::sigemt;
#endif
#if defined(BOOST_PLATIO_HAS_SIGINFO)
inline constexpr int siginfo   = detail::platform_signals::siginfo;
#endif
#if defined(BOOST_PLATIO_HAS_SIGPOLL)
inline constexpr int sigpoll   = detail::platform_signals::sigpoll;
#endif
#if defined(BOOST_PLATIO_HAS_SIGPWR)
inline constexpr int sigpwr    = detail::platform_signals::sigpwr;
#endif
#if defined(BOOST_PLATIO_HAS_SIGSTKFLT)
inline constexpr int sigstkflt = detail::platform_signals::sigstkflt;
#endif

/** Return the name of the signal table compiled into this build. */
constexpr char const*
signal_table_name() noexcept
{
    return detail::platform_signals::name;
}

} // namespace platio
} // namespace boost

#endif
