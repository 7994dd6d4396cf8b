//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

// Test that header file is self-contained.
#include <boost/platio/multicast.hpp>

#include <boost/core/lightweight_test.hpp>
#include <boost/system/errc.hpp>

#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace boost::platio {

//------------------------------------------------
// Multicast membership request tests
//------------------------------------------------

struct multicast_test
{
    void
    testDefaultInterface()
    {
        auto r = multicast_request::make(
            inet_address(urls::ipv4_address({224, 0, 0, 251}), 5353));
        BOOST_TEST(r.has_value());
        BOOST_TEST(r->group() == urls::ipv4_address({224, 0, 0, 251}));
        BOOST_TEST(r->interface_address() == urls::ipv4_address::any());
        BOOST_TEST_EQ(r->native().imr_interface.s_addr, htonl(INADDR_ANY));
        BOOST_TEST_EQ(
            r->native().imr_multiaddr.s_addr, htonl(0xe00000fb));
        BOOST_TEST_EQ(r->size(), sizeof(::ip_mreq));
        BOOST_TEST(r->data() == &r->native());
    }

    void
    testExplicitInterface()
    {
        auto r = multicast_request::make(
            inet_address(urls::ipv4_address({239, 1, 2, 3}), 0),
            inet_address(urls::ipv4_address({192, 168, 0, 10}), 0));
        BOOST_TEST(r.has_value());
        BOOST_TEST(r->group() == urls::ipv4_address({239, 1, 2, 3}));
        BOOST_TEST(
            r->interface_address() == urls::ipv4_address({192, 168, 0, 10}));
        BOOST_TEST_EQ(
            r->native().imr_interface.s_addr, htonl(0xc0a8000a));
    }

    void
    testRejectsV6()
    {
        auto group6 = multicast_request::make(
            inet_address(urls::ipv6_address::loopback(), 0));
        BOOST_TEST(group6.has_error());
        BOOST_TEST(group6.error() == system::errc::invalid_argument);

        auto iface6 = multicast_request::make(
            inet_address(urls::ipv4_address({224, 0, 0, 1}), 0),
            inet_address(urls::ipv6_address::loopback(), 0));
        BOOST_TEST(iface6.has_error());
        BOOST_TEST(iface6.error() == system::errc::invalid_argument);
    }

    void
    testStream()
    {
        std::ostringstream os;
        os << multicast_request::make(
            inet_address(urls::ipv4_address({224, 0, 0, 251}), 0)).value();
        BOOST_TEST_EQ(os.str(),
            "ip_mreq { imr_multiaddr: 224.0.0.251, imr_interface: 0.0.0.0 }");
    }

    void
    run()
    {
        testDefaultInterface();
        testExplicitInterface();
        testRejectsV6();
        testStream();
    }
};

} // namespace boost::platio

int
main()
{
    boost::platio::multicast_test().run();
    return boost::report_errors();
}
