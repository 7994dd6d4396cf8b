//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

// Test that header file is self-contained.
#include <boost/platio/signal_action.hpp>

#include <boost/platio/signals.hpp>
#include <boost/core/lightweight_test.hpp>

#include <cstring>

#include <signal.h>

namespace boost::platio {

namespace {

void
plain_handler(int)
{
}

void
info_handler_fn(int, ::siginfo_t*, void*)
{
}

} // namespace

//------------------------------------------------
// Signal action tests
// Focus: construction, flag mapping, handler kinds
//------------------------------------------------

struct signal_action_test
{
    void
    testPlainHandler()
    {
        signal_action act(plain_handler, signal_action::none, signal_set());

        BOOST_TEST(!act.uses_info());
        BOOST_TEST(act.handler() == &plain_handler);
        BOOST_TEST(act.info_handler() == nullptr);
        BOOST_TEST(act.flags() == signal_action::none);
    }

    void
    testPlainHandlerFlags()
    {
        signal_action act(
            plain_handler,
            signal_action::restart | signal_action::no_defer,
            signal_set());

        BOOST_TEST((act.flags() & signal_action::restart) ==
            signal_action::restart);
        BOOST_TEST((act.flags() & signal_action::no_defer) ==
            signal_action::no_defer);
        BOOST_TEST((act.flags() & signal_action::siginfo) ==
            signal_action::none);
    }

    void
    testInfoHandlerAddsSiginfo()
    {
        signal_action act(
            info_handler_fn, signal_action::none, signal_set());

        BOOST_TEST(act.uses_info());
        BOOST_TEST((act.flags() & signal_action::siginfo) ==
            signal_action::siginfo);
        BOOST_TEST(act.info_handler() == &info_handler_fn);
        BOOST_TEST(act.handler() == nullptr);
    }

    void
    testInfoHandlerKeepsCallerFlags()
    {
        signal_action act(
            info_handler_fn, signal_action::restart, signal_set());

        BOOST_TEST((act.flags() & signal_action::restart) ==
            signal_action::restart);
        BOOST_TEST((act.flags() & signal_action::siginfo) ==
            signal_action::siginfo);
    }

    void
    testResetHandlerHighBit()
    {
        signal_action act(
            plain_handler, signal_action::reset_handler, signal_set());

        BOOST_TEST(act.flags() == signal_action::reset_handler);
    }

    void
    testMask()
    {
        signal_set mask;
        mask.add(sigusr2).value();

        signal_action act(plain_handler, signal_action::none, mask);

        BOOST_TEST(act.mask().contains(sigusr2).value());
        BOOST_TEST(!act.mask().contains(sigusr1).value());
    }

    void
    testIgnore()
    {
        auto act = signal_action::ignore();

        BOOST_TEST(act.handler() == SIG_IGN);
        BOOST_TEST(!act.uses_info());
    }

    void
    testDefaults()
    {
        auto act = signal_action::defaults();

        BOOST_TEST(act.handler() == SIG_DFL);
        BOOST_TEST(!act.uses_info());
    }

    void
    testNativeFullyDetermined()
    {
        // Equal inputs give byte identical native structs, so
        // no reserved field or padding byte is left indeterminate
        signal_set mask;
        mask.add(sigterm).value();

        signal_action a(plain_handler, signal_action::restart, mask);
        signal_action b(plain_handler, signal_action::restart, mask);

        BOOST_TEST(std::memcmp(
            &a.native(), &b.native(), sizeof(a.native())) == 0);
    }

    void
    testFromNative()
    {
        signal_action a(info_handler_fn, signal_action::on_stack,
            signal_set());
        signal_action b(a.native());

        BOOST_TEST(b.uses_info());
        BOOST_TEST(b.info_handler() == &info_handler_fn);
        BOOST_TEST((b.flags() & signal_action::on_stack) ==
            signal_action::on_stack);
    }

    void
    testFlagsBitwiseOperations()
    {
        auto f = signal_action::restart;
        f |= signal_action::no_child_stop;

        BOOST_TEST((f & signal_action::restart) == signal_action::restart);
        BOOST_TEST((f & signal_action::no_child_stop) ==
            signal_action::no_child_stop);

        f &= ~signal_action::restart;
        BOOST_TEST((f & signal_action::restart) == signal_action::none);
        BOOST_TEST(f == signal_action::no_child_stop);
    }

    void
    testFlagsDistinct()
    {
        signal_action::flags_t const all[] = {
            signal_action::no_child_stop,
            signal_action::no_child_wait,
            signal_action::no_defer,
            signal_action::on_stack,
            signal_action::reset_handler,
            signal_action::restart,
            signal_action::siginfo
        };

        for (auto a : all)
        {
            BOOST_TEST(a != signal_action::none);
            for (auto b : all)
                if (a != b)
                    BOOST_TEST((a & b) == signal_action::none);
        }
    }

    void
    run()
    {
        testPlainHandler();
        testPlainHandlerFlags();
        testInfoHandlerAddsSiginfo();
        testInfoHandlerKeepsCallerFlags();
        testResetHandlerHighBit();
        testMask();
        testIgnore();
        testDefaults();
        testNativeFullyDetermined();
        testFromNative();
        testFlagsBitwiseOperations();
        testFlagsDistinct();
    }
};

} // namespace boost::platio

int
main()
{
    boost::platio::signal_action_test().run();
    return boost::report_errors();
}
