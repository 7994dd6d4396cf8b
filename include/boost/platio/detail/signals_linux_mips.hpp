//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_DETAIL_SIGNALS_LINUX_MIPS_HPP
#define BOOST_PLATIO_DETAIL_SIGNALS_LINUX_MIPS_HPP

#include <boost/platio/detail/posix_common_signals.hpp>

#include <cstddef>

namespace boost {
namespace platio {
namespace detail {

/** Signal table for Linux on MIPS.

    MIPS kept the IRIX numbering, so most signals above
    SIGTERM and several flag bits differ from asm-generic.
*/
struct linux_mips_signals : posix_common_signals
{
    static constexpr char const* name = "linux-mips";

    using flags_type = unsigned int;

    static constexpr int sigemt    = 7;
    static constexpr int sigbus    = 10;
    static constexpr int sigsys    = 12;
    static constexpr int sigusr1   = 16;
    static constexpr int sigusr2   = 17;
    static constexpr int sigchld   = 18;
    static constexpr int sigpwr    = 19;
    static constexpr int sigwinch  = 20;
    static constexpr int sigurg    = 21;
    static constexpr int sigio     = 22;
    static constexpr int sigpoll   = 22;
    static constexpr int sigstop   = 23;
    static constexpr int sigtstp   = 24;
    static constexpr int sigcont   = 25;
    static constexpr int sigttin   = 26;
    static constexpr int sigttou   = 27;
    static constexpr int sigvtalrm = 28;
    static constexpr int sigprof   = 29;
    static constexpr int sigxcpu   = 30;
    static constexpr int sigxfsz   = 31;

    static constexpr flags_type sa_nocldstop = 0x00000001;
    static constexpr flags_type sa_siginfo   = 0x00000008;
    static constexpr flags_type sa_nocldwait = 0x00010000;
    static constexpr flags_type sa_onstack   = 0x08000000;
    static constexpr flags_type sa_restart   = 0x10000000;
    static constexpr flags_type sa_nodefer   = 0x40000000;
    static constexpr flags_type sa_resethand = 0x80000000;

    static constexpr int sig_block   = 1;
    static constexpr int sig_unblock = 2;
    static constexpr int sig_setmask = 3;

    static constexpr std::size_t sigset_bits = 1024;
};

} // detail
} // platio
} // boost

#endif
