//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#include <boost/platio/signal.hpp>
#include <boost/platio/detail/zeroed.hpp>

#include "src/detail/make_err.hpp"

#include <algorithm>
#include <chrono>

#include <errno.h>
#include <pthread.h>
#include <signal.h>
#include <time.h>

namespace boost::platio {

//------------------------------------------------------------------------------
// The signal table must agree with <signal.h>
//------------------------------------------------------------------------------

namespace {

using table = detail::platform_signals;

static_assert(table::sighup == SIGHUP);
static_assert(table::sigint == SIGINT);
static_assert(table::sigquit == SIGQUIT);
static_assert(table::sigill == SIGILL);
static_assert(table::sigtrap == SIGTRAP);
static_assert(table::sigabrt == SIGABRT);
#if defined(SIGIOT)
static_assert(table::sigiot == SIGIOT);
#endif
static_assert(table::sigbus == SIGBUS);
static_assert(table::sigfpe == SIGFPE);
static_assert(table::sigkill == SIGKILL);
static_assert(table::sigusr1 == SIGUSR1);
static_assert(table::sigsegv == SIGSEGV);
static_assert(table::sigusr2 == SIGUSR2);
static_assert(table::sigpipe == SIGPIPE);
static_assert(table::sigalrm == SIGALRM);
static_assert(table::sigterm == SIGTERM);
static_assert(table::sigchld == SIGCHLD);
static_assert(table::sigcont == SIGCONT);
static_assert(table::sigstop == SIGSTOP);
static_assert(table::sigtstp == SIGTSTP);
static_assert(table::sigttin == SIGTTIN);
static_assert(table::sigttou == SIGTTOU);
static_assert(table::sigurg == SIGURG);
static_assert(table::sigxcpu == SIGXCPU);
static_assert(table::sigxfsz == SIGXFSZ);
static_assert(table::sigvtalrm == SIGVTALRM);
static_assert(table::sigprof == SIGPROF);
static_assert(table::sigwinch == SIGWINCH);
static_assert(table::sigio == SIGIO);
static_assert(table::sigsys == SIGSYS);

#if defined(BOOST_PLATIO_HAS_SIGEMT) && defined(SIGEMT)
static_assert(table::sigemt == SIGEMT);
#endif
#if defined(BOOST_PLATIO_HAS_SIGINFO) && defined(SIGINFO)
static_assert(table::siginfo == SIGINFO);
#endif
#if defined(BOOST_PLATIO_HAS_SIGPOLL) && defined(SIGPOLL)
static_assert(table::sigpoll == SIGPOLL);
#endif
#if defined(BOOST_PLATIO_HAS_SIGPWR) && defined(SIGPWR)
static_assert(table::sigpwr == SIGPWR);
#endif
#if defined(BOOST_PLATIO_HAS_SIGSTKFLT) && defined(SIGSTKFLT)
static_assert(table::sigstkflt == SIGSTKFLT);
#endif

static_assert(table::sa_nocldstop == static_cast<table::flags_type>(SA_NOCLDSTOP));
static_assert(table::sa_nocldwait == static_cast<table::flags_type>(SA_NOCLDWAIT));
static_assert(table::sa_nodefer == static_cast<table::flags_type>(SA_NODEFER));
static_assert(table::sa_onstack == static_cast<table::flags_type>(SA_ONSTACK));
static_assert(table::sa_resethand == static_cast<table::flags_type>(SA_RESETHAND));
static_assert(table::sa_restart == static_cast<table::flags_type>(SA_RESTART));
static_assert(table::sa_siginfo == static_cast<table::flags_type>(SA_SIGINFO));

static_assert(table::sig_block == SIG_BLOCK);
static_assert(table::sig_unblock == SIG_UNBLOCK);
static_assert(table::sig_setmask == SIG_SETMASK);

::timespec
to_timespec(std::chrono::nanoseconds d) noexcept
{
    auto ts = detail::zeroed<::timespec>();
    if (d <= std::chrono::nanoseconds::zero())
        return ts;

    auto const secs = std::chrono::duration_cast<std::chrono::seconds>(d);
    ts.tv_sec = static_cast<::time_t>(secs.count());
    ts.tv_nsec = static_cast<long>((d - secs).count());
    return ts;
}

} // namespace

//------------------------------------------------------------------------------

system::result<signal_action>
install_action(int signal_number, signal_action const& action)
{
    auto old = detail::zeroed<struct ::sigaction>();
    if (::sigaction(signal_number, &action.native(), &old) < 0)
        return detail::last_err();
    return signal_action(old);
}

system::result<signal_action>
query_action(int signal_number)
{
    auto old = detail::zeroed<struct ::sigaction>();
    if (::sigaction(signal_number, nullptr, &old) < 0)
        return detail::last_err();
    return signal_action(old);
}

system::result<signal_set>
set_thread_mask(mask_how how, signal_set const& set)
{
    auto old = detail::zeroed<::sigset_t>();

    // pthread_sigmask returns the error number instead of setting errno
    int const res = ::pthread_sigmask(
        static_cast<int>(how), &set.native(), &old);
    if (res != 0)
        return detail::make_err(res);
    return signal_set(old);
}

system::result<signal_set>
thread_mask()
{
    auto old = detail::zeroed<::sigset_t>();

    // The how argument is ignored when the new set is null
    int const res = ::pthread_sigmask(
        static_cast<int>(mask_how::block), nullptr, &old);
    if (res != 0)
        return detail::make_err(res);
    return signal_set(old);
}

system::result<void>
send_to_process(::pid_t pid, int signal_number)
{
    if (::kill(pid, signal_number) < 0)
        return detail::last_err();
    return {};
}

system::result<void>
send_to_thread(thread_id tid, int signal_number)
{
    // pthread_kill returns the error number instead of setting errno
    int const res = ::pthread_kill(tid, signal_number);
    if (res != 0)
        return detail::make_err(res);
    return {};
}

#if !defined(__APPLE__)

system::result<signal_info>
wait(signal_set const& set)
{
    auto info = detail::zeroed<::siginfo_t>();
    if (::sigwaitinfo(&set.native(), &info) < 0)
        return detail::last_err();
    return signal_info(info);
}

system::result<signal_info>
wait_for(signal_set const& set, std::chrono::nanoseconds timeout)
{
    auto info = detail::zeroed<::siginfo_t>();
    auto const ts = to_timespec(timeout);
    if (::sigtimedwait(&set.native(), &info, &ts) < 0)
    {
        // POSIX reports an expired wait as EAGAIN
        if (errno == EAGAIN)
            return detail::make_err(ETIMEDOUT);
        return detail::last_err();
    }
    return signal_info(info);
}

#else

// Darwin has neither sigwaitinfo nor sigtimedwait. sigwait
// consumes the signal but reports only its number.

namespace {

// Interval between pending checks of a timed wait
constexpr std::chrono::milliseconds poll_interval(1);

signal_info
info_for(int signal_number) noexcept
{
    auto info = detail::zeroed<::siginfo_t>();
    info.si_signo = signal_number;
    return signal_info(info);
}

// Lowest numbered signal of set that is pending, or zero
system::result<int>
first_pending(signal_set const& set)
{
    auto ready = detail::zeroed<::sigset_t>();
    if (::sigpending(&ready) < 0)
        return detail::last_err();

    for (int n = 1; n < NSIG; ++n)
    {
        if (::sigismember(&ready, n) == 1 &&
            ::sigismember(&set.native(), n) == 1)
            return n;
    }
    return 0;
}

system::result<signal_info>
consume(int signal_number)
{
    auto one = detail::zeroed<::sigset_t>();
    if (::sigemptyset(&one) < 0 || ::sigaddset(&one, signal_number) < 0)
        return detail::last_err();

    int received = 0;
    int const res = ::sigwait(&one, &received);
    if (res != 0)
        return detail::make_err(res);
    return info_for(received);
}

} // namespace

system::result<signal_info>
wait(signal_set const& set)
{
    int signal_number = 0;

    // sigwait returns the error number instead of setting errno
    int const res = ::sigwait(&set.native(), &signal_number);
    if (res != 0)
        return detail::make_err(res);
    return info_for(signal_number);
}

system::result<signal_info>
wait_for(signal_set const& set, std::chrono::nanoseconds timeout)
{
    using clock = std::chrono::steady_clock;

    auto const start = clock::now();
    auto const deadline =
        timeout >= clock::time_point::max() - start
            ? clock::time_point::max()
            : start + std::chrono::duration_cast<clock::duration>(
                (std::max)(timeout, std::chrono::nanoseconds::zero()));

    // sigwait has no timeout, so it is called only once a
    // member of the set is known to be pending
    for (;;)
    {
        auto n = first_pending(set);
        if (n.has_error())
            return n.error();
        if (*n != 0)
            return consume(*n);

        auto const left = deadline - clock::now();
        if (left <= clock::duration::zero())
            return detail::make_err(ETIMEDOUT);

        auto const ts = to_timespec((std::min)(
            std::chrono::duration_cast<std::chrono::nanoseconds>(left),
            std::chrono::nanoseconds(poll_interval)));

        // An interrupted sleep is followed by the deadline check
        if (::nanosleep(&ts, nullptr) < 0 && errno != EINTR)
            return detail::last_err();
    }
}

#endif

system::result<signal_set>
pending()
{
    auto set = detail::zeroed<::sigset_t>();
    if (::sigpending(&set) < 0)
        return detail::last_err();
    return signal_set(set);
}

} // namespace boost::platio
