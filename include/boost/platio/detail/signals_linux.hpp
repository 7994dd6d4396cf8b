//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_DETAIL_SIGNALS_LINUX_HPP
#define BOOST_PLATIO_DETAIL_SIGNALS_LINUX_HPP

#include <boost/platio/detail/posix_common_signals.hpp>

#include <climits>
#include <cstddef>

namespace boost {
namespace platio {
namespace detail {

/** Signal table for Linux on x86, x86_64, ARM and AArch64.

    These architectures use the asm-generic numbering and
    flag layout.
*/
struct linux_generic_signals : posix_common_signals
{
    static constexpr char const* name = "linux-generic";

    using flags_type = unsigned long;

    static constexpr int sigbus    = 7;
    static constexpr int sigusr1   = 10;
    static constexpr int sigusr2   = 12;
    static constexpr int sigstkflt = 16;
    static constexpr int sigchld   = 17;
    static constexpr int sigcont   = 18;
    static constexpr int sigstop   = 19;
    static constexpr int sigtstp   = 20;
    static constexpr int sigttin   = 21;
    static constexpr int sigttou   = 22;
    static constexpr int sigurg    = 23;
    static constexpr int sigxcpu   = 24;
    static constexpr int sigxfsz   = 25;
    static constexpr int sigvtalrm = 26;
    static constexpr int sigprof   = 27;
    static constexpr int sigwinch  = 28;
    static constexpr int sigio     = 29;
    static constexpr int sigpoll   = 29;
    static constexpr int sigpwr    = 30;
    static constexpr int sigsys    = 31;

    static constexpr flags_type sa_nocldstop = 0x00000001;
    static constexpr flags_type sa_nocldwait = 0x00000002;
    static constexpr flags_type sa_siginfo   = 0x00000004;
    static constexpr flags_type sa_onstack   = 0x08000000;
    static constexpr flags_type sa_restart   = 0x10000000;
    static constexpr flags_type sa_nodefer   = 0x40000000;
    static constexpr flags_type sa_resethand = 0x80000000;

    static constexpr int sig_block   = 0;
    static constexpr int sig_unblock = 1;
    static constexpr int sig_setmask = 2;

#if defined(__BIONIC__)
    static constexpr std::size_t sigset_bits =
        sizeof(unsigned long) * CHAR_BIT;
#else
    // glibc and musl reserve room for 1024 signals
    static constexpr std::size_t sigset_bits = 1024;
#endif
};

} // detail
} // platio
} // boost

#endif
