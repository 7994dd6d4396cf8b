//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_DETAIL_PLATFORM_SIGNALS_HPP
#define BOOST_PLATIO_DETAIL_PLATFORM_SIGNALS_HPP

#include <boost/platio/detail/config.hpp>

#include <concepts>
#include <cstddef>

//
// Signal table selection.
//
// Exactly one table is compiled in per target:
//   BOOST_PLATIO_SIGNALS_LINUX_GENERIC - Linux on x86, x86_64, ARM, AArch64
//   BOOST_PLATIO_SIGNALS_LINUX_MIPS    - Linux on MIPS
//   BOOST_PLATIO_SIGNALS_BSD           - macOS, iOS, FreeBSD, DragonFly
//
// Any other target is rejected here rather than silently given
// the wrong numbering.
//

#if defined(__linux__)
# if defined(__mips__)
#  define BOOST_PLATIO_SIGNALS_LINUX_MIPS 1
#  include <boost/platio/detail/signals_linux_mips.hpp>
# elif defined(__i386__) || defined(__x86_64__) || \
       defined(__arm__) || defined(__aarch64__)
#  define BOOST_PLATIO_SIGNALS_LINUX_GENERIC 1
#  include <boost/platio/detail/signals_linux.hpp>
# else
#  error "Boost.Platio: no signal table for this Linux architecture"
# endif
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__DragonFly__)
# define BOOST_PLATIO_SIGNALS_BSD 1
# include <boost/platio/detail/signals_bsd.hpp>
#else
# error "Boost.Platio: no signal table for this operating system"
#endif

namespace boost {
namespace platio {
namespace detail {

/** The interface every platform signal table provides. */
template<class T>
concept signal_table =
    std::integral<typename T::flags_type> &&
    requires
    {
        typename T::native_action;
        typename T::native_set;
        typename T::native_info;

        { T::name } -> std::convertible_to<char const*>;
        { T::sigset_bits } -> std::convertible_to<std::size_t>;

        { T::sigbus } -> std::convertible_to<int>;
        { T::sigsys } -> std::convertible_to<int>;
        { T::sigurg } -> std::convertible_to<int>;
        { T::sigstop } -> std::convertible_to<int>;
        { T::sigtstp } -> std::convertible_to<int>;
        { T::sigcont } -> std::convertible_to<int>;
        { T::sigchld } -> std::convertible_to<int>;
        { T::sigttin } -> std::convertible_to<int>;
        { T::sigttou } -> std::convertible_to<int>;
        { T::sigio } -> std::convertible_to<int>;
        { T::sigxcpu } -> std::convertible_to<int>;
        { T::sigxfsz } -> std::convertible_to<int>;
        { T::sigvtalrm } -> std::convertible_to<int>;
        { T::sigprof } -> std::convertible_to<int>;
        { T::sigwinch } -> std::convertible_to<int>;
        { T::sigusr1 } -> std::convertible_to<int>;
        { T::sigusr2 } -> std::convertible_to<int>;

        { T::sa_nocldstop } -> std::convertible_to<typename T::flags_type>;
        { T::sa_nocldwait } -> std::convertible_to<typename T::flags_type>;
        { T::sa_nodefer } -> std::convertible_to<typename T::flags_type>;
        { T::sa_onstack } -> std::convertible_to<typename T::flags_type>;
        { T::sa_resethand } -> std::convertible_to<typename T::flags_type>;
        { T::sa_restart } -> std::convertible_to<typename T::flags_type>;
        { T::sa_siginfo } -> std::convertible_to<typename T::flags_type>;

        { T::sig_block } -> std::convertible_to<int>;
        { T::sig_unblock } -> std::convertible_to<int>;
        { T::sig_setmask } -> std::convertible_to<int>;
    };

#if defined(BOOST_PLATIO_SIGNALS_LINUX_GENERIC)
using platform_signals = linux_generic_signals;
#elif defined(BOOST_PLATIO_SIGNALS_LINUX_MIPS)
using platform_signals = linux_mips_signals;
#else
using platform_signals = bsd_signals;
#endif

static_assert(signal_table<platform_signals>);

} // detail
} // platio
} // boost

#endif
