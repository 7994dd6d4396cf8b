//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_DETAIL_POSIX_COMMON_SIGNALS_HPP
#define BOOST_PLATIO_DETAIL_POSIX_COMMON_SIGNALS_HPP

#include <signal.h>

namespace boost {
namespace platio {
namespace detail {

/** Signal numbers shared by every supported platform.

    These are the historical values POSIX leaves unspecified but
    which every Unix has agreed on since V7.
*/
struct posix_common_signals
{
    using native_action = struct ::sigaction;
    using native_set = ::sigset_t;
    using native_info = ::siginfo_t;

    static constexpr int sighup  = 1;
    static constexpr int sigint  = 2;
    static constexpr int sigquit = 3;
    static constexpr int sigill  = 4;
    static constexpr int sigtrap = 5;
    static constexpr int sigabrt = 6;
    static constexpr int sigiot  = 6;
    static constexpr int sigfpe  = 8;
    static constexpr int sigkill = 9;
    static constexpr int sigsegv = 11;
    static constexpr int sigpipe = 13;
    static constexpr int sigalrm = 14;
    static constexpr int sigterm = 15;
};

} // detail
} // platio
} // boost

#endif
