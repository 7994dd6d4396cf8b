//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

// Test that header file is self-contained.
#include <boost/platio/signals.hpp>

#include <boost/platio/signal_action.hpp>
#include <boost/core/lightweight_test.hpp>

#include <climits>
#include <cstring>

#include <signal.h>

namespace boost::platio {

//------------------------------------------------
// Platform signal table tests
// Focus: the selected table agrees with <signal.h>
//------------------------------------------------

struct signals_test
{
    void
    testCommonNumbers()
    {
        BOOST_TEST_EQ(sighup, 1);
        BOOST_TEST_EQ(sigint, 2);
        BOOST_TEST_EQ(sigquit, 3);
        BOOST_TEST_EQ(sigill, 4);
        BOOST_TEST_EQ(sigtrap, 5);
        BOOST_TEST_EQ(sigabrt, 6);
        BOOST_TEST_EQ(sigfpe, 8);
        BOOST_TEST_EQ(sigkill, 9);
        BOOST_TEST_EQ(sigsegv, 11);
        BOOST_TEST_EQ(sigpipe, 13);
        BOOST_TEST_EQ(sigalrm, 14);
        BOOST_TEST_EQ(sigterm, 15);
    }

    void
    testPlatformNumbers()
    {
        BOOST_TEST_EQ(sigbus, SIGBUS);
        BOOST_TEST_EQ(sigusr1, SIGUSR1);
        BOOST_TEST_EQ(sigusr2, SIGUSR2);
        BOOST_TEST_EQ(sigchld, SIGCHLD);
        BOOST_TEST_EQ(sigcont, SIGCONT);
        BOOST_TEST_EQ(sigstop, SIGSTOP);
        BOOST_TEST_EQ(sigtstp, SIGTSTP);
        BOOST_TEST_EQ(sigttin, SIGTTIN);
        BOOST_TEST_EQ(sigttou, SIGTTOU);
        BOOST_TEST_EQ(sigurg, SIGURG);
        BOOST_TEST_EQ(sigxcpu, SIGXCPU);
        BOOST_TEST_EQ(sigxfsz, SIGXFSZ);
        BOOST_TEST_EQ(sigvtalrm, SIGVTALRM);
        BOOST_TEST_EQ(sigprof, SIGPROF);
        BOOST_TEST_EQ(sigwinch, SIGWINCH);
        BOOST_TEST_EQ(sigio, SIGIO);
        BOOST_TEST_EQ(sigsys, SIGSYS);
    }

    void
    testLinuxGenericNumbers()
    {
#if defined(BOOST_PLATIO_SIGNALS_LINUX_GENERIC)
        BOOST_TEST_EQ(sigbus, 7);
        BOOST_TEST_EQ(sigusr1, 10);
        BOOST_TEST_EQ(sigusr2, 12);
        BOOST_TEST_EQ(sigstkflt, 16);
        BOOST_TEST_EQ(sigchld, 17);
        BOOST_TEST_EQ(sigwinch, 28);
        BOOST_TEST_EQ(sigpoll, sigio);
        BOOST_TEST_EQ(sigpwr, 30);
        BOOST_TEST_EQ(sigsys, 31);
#endif
    }

    void
    testFlagBits()
    {
        BOOST_TEST(static_cast<unsigned long>(signal_action::restart) ==
            static_cast<unsigned long>(
                static_cast<unsigned int>(SA_RESTART)));
        BOOST_TEST(static_cast<unsigned long>(signal_action::siginfo) ==
            static_cast<unsigned long>(
                static_cast<unsigned int>(SA_SIGINFO)));
        BOOST_TEST(static_cast<unsigned long>(signal_action::reset_handler) ==
            static_cast<unsigned long>(
                static_cast<unsigned int>(SA_RESETHAND)));
        BOOST_TEST(static_cast<unsigned long>(signal_action::on_stack) ==
            static_cast<unsigned long>(
                static_cast<unsigned int>(SA_ONSTACK)));
    }

    void
    testSigsetWidth()
    {
#if !defined(__BIONIC__)
        BOOST_TEST_EQ(
            sizeof(::sigset_t) * CHAR_BIT,
            detail::platform_signals::sigset_bits);
#endif
    }

    void
    testTableName()
    {
        char const* name = signal_table_name();
        BOOST_TEST(name != nullptr);
        BOOST_TEST(std::strlen(name) > 0);
    }

    void
    run()
    {
        testCommonNumbers();
        testPlatformNumbers();
        testLinuxGenericNumbers();
        testFlagBits();
        testSigsetWidth();
        testTableName();
    }
};

} // namespace boost::platio

int
main()
{
    boost::platio::signals_test().run();
    return boost::report_errors();
}
