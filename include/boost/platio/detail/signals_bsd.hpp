//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_DETAIL_SIGNALS_BSD_HPP
#define BOOST_PLATIO_DETAIL_SIGNALS_BSD_HPP

#include <boost/platio/detail/posix_common_signals.hpp>

#include <cstddef>

namespace boost {
namespace platio {
namespace detail {

/** Signal table for macOS, iOS, FreeBSD and DragonFly.

    The 4.4BSD numbering and flag layout. The signal mask is a
    single 32 bit word on Darwin and four words elsewhere.
*/
struct bsd_signals : posix_common_signals
{
    static constexpr char const* name = "bsd";

    using flags_type = int;

    static constexpr int sigemt    = 7;
    static constexpr int sigbus    = 10;
    static constexpr int sigsys    = 12;
    static constexpr int sigurg    = 16;
    static constexpr int sigstop   = 17;
    static constexpr int sigtstp   = 18;
    static constexpr int sigcont   = 19;
    static constexpr int sigchld   = 20;
    static constexpr int sigttin   = 21;
    static constexpr int sigttou   = 22;
    static constexpr int sigio     = 23;
    static constexpr int sigxcpu   = 24;
    static constexpr int sigxfsz   = 25;
    static constexpr int sigvtalrm = 26;
    static constexpr int sigprof   = 27;
    static constexpr int sigwinch  = 28;
    static constexpr int siginfo   = 29;
    static constexpr int sigusr1   = 30;
    static constexpr int sigusr2   = 31;

    static constexpr flags_type sa_onstack   = 0x0001;
    static constexpr flags_type sa_restart   = 0x0002;
    static constexpr flags_type sa_resethand = 0x0004;
    static constexpr flags_type sa_nocldstop = 0x0008;
    static constexpr flags_type sa_nodefer   = 0x0010;
    static constexpr flags_type sa_nocldwait = 0x0020;
    static constexpr flags_type sa_siginfo   = 0x0040;

    static constexpr int sig_block   = 1;
    static constexpr int sig_unblock = 2;
    static constexpr int sig_setmask = 3;

#if defined(__APPLE__)
    static constexpr std::size_t sigset_bits = 32;
#else
    static constexpr std::size_t sigset_bits = 128;
#endif
};

} // detail
} // platio
} // boost

#endif
