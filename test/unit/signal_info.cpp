//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

// Test that header file is self-contained.
#include <boost/platio/signal_info.hpp>

#include <boost/core/lightweight_test.hpp>

#include <cstring>

#include <signal.h>

namespace boost::platio {

namespace {

::siginfo_t
make_info(int signal_number, int code)
{
    ::siginfo_t si;
    std::memset(&si, 0, sizeof(si));
    si.si_signo = signal_number;
    si.si_code = code;
    return si;
}

} // namespace

//------------------------------------------------
// Signal information decoding tests
// Focus: fields are read only where the cause defines them
//------------------------------------------------

struct signal_info_test
{
    void
    testDefault()
    {
        signal_info info;

        BOOST_TEST_EQ(info.signal_number(), 0);
        BOOST_TEST_EQ(info.error(), 0);
        BOOST_TEST_EQ(info.code(), 0);
        BOOST_TEST_EQ(info.pid(), 0);
        BOOST_TEST_EQ(info.uid(), 0u);
        BOOST_TEST_EQ(info.status(), 0);
    }

    void
    testUserSender()
    {
        auto si = make_info(SIGUSR1, SI_USER);
        si.si_pid = 1234;
        si.si_uid = 1000;

        signal_info info(si);
        BOOST_TEST_EQ(info.signal_number(), SIGUSR1);
        BOOST_TEST_EQ(info.code(), SI_USER);
        BOOST_TEST_EQ(info.pid(), 1234);
        BOOST_TEST_EQ(info.uid(), 1000u);
        BOOST_TEST_EQ(info.status(), 0);
    }

    void
    testQueuedPayloadIgnored()
    {
        auto si = make_info(SIGUSR1, SI_QUEUE);
        si.si_pid = 77;
        si.si_value.sival_int = 42;

        signal_info info(si);
        BOOST_TEST_EQ(info.code(), SI_QUEUE);
        BOOST_TEST_EQ(info.pid(), 77);
        BOOST_TEST_EQ(info.status(), 0);
    }

    void
    testChildExited()
    {
        auto si = make_info(SIGCHLD, CLD_EXITED);
        si.si_pid = 4321;
        si.si_uid = 1000;
        si.si_status = 3;

        signal_info info(si);
        BOOST_TEST_EQ(info.code(), CLD_EXITED);
        BOOST_TEST_EQ(info.pid(), 4321);
        BOOST_TEST_EQ(info.uid(), 1000u);
        BOOST_TEST_EQ(info.status(), 3);
    }

    void
    testChildSignalFromKill()
    {
        // SIGCHLD sent with kill carries a sender but no status
        auto si = make_info(SIGCHLD, SI_USER);
        si.si_pid = 55;
        si.si_status = 9;

        signal_info info(si);
        BOOST_TEST_EQ(info.pid(), 55);
        BOOST_TEST_EQ(info.status(), 0);
    }

    void
    testFaultHasNoSender()
    {
        auto si = make_info(SIGSEGV, SEGV_MAPERR);
        si.si_errno = 14;
        si.si_addr = &si;

        signal_info info(si);
        BOOST_TEST_EQ(info.signal_number(), SIGSEGV);
        BOOST_TEST_EQ(info.error(), 14);
        BOOST_TEST_EQ(info.code(), SEGV_MAPERR);
        BOOST_TEST_EQ(info.pid(), 0);
        BOOST_TEST_EQ(info.uid(), 0u);
        BOOST_TEST_EQ(info.status(), 0);
    }

    void
    run()
    {
        testDefault();
        testUserSender();
        testQueuedPayloadIgnored();
        testChildExited();
        testChildSignalFromKill();
        testFaultHasNoSender();
    }
};

} // namespace boost::platio

int
main()
{
    boost::platio::signal_info_test().run();
    return boost::report_errors();
}
