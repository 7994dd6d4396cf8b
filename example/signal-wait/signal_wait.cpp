//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#include <boost/platio.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>

namespace platio = boost::platio;

int
main()
{
    using namespace std::chrono_literals;

    std::cout << "Signal table: " << platio::signal_table_name() << "\n";

    // Block SIGUSR1 so it stays pending until collected below
    platio::signal_set set;
    if (auto r = set.add(platio::sigusr1); !r)
    {
        std::cerr << "add: " << r.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto old_mask = platio::set_thread_mask(platio::mask_how::block, set);
    if (!old_mask)
    {
        std::cerr << "set_thread_mask: " << old_mask.error().message() << "\n";
        return EXIT_FAILURE;
    }

    // Deliver to ourselves
    auto sent = platio::send_to_thread(
        platio::this_thread_id(), platio::sigusr1);
    if (!sent)
    {
        std::cerr << "send_to_thread: " << sent.error().message() << "\n";
        return EXIT_FAILURE;
    }

    // Already pending, so this returns at once
    auto info = platio::wait(set);
    if (!info)
    {
        std::cerr << "wait: " << info.error().message() << "\n";
        return EXIT_FAILURE;
    }
    std::cout
        << "Received signal " << info->signal_number()
        << " code " << info->code()
        << " from pid " << info->pid() << "\n";

    // Nothing else is pending, so a zero timeout polls and times out
    auto again = platio::wait_for(set, 0s);
    std::cout << "Poll: " << (again ? "signal" : again.error().message())
        << "\n";

    auto restored = platio::set_thread_mask(platio::mask_how::set, *old_mask);
    if (!restored)
    {
        std::cerr << "set_thread_mask: " << restored.error().message() << "\n";
        return EXIT_FAILURE;
    }

    // A few socket addresses
    platio::socket_address v4(boost::urls::ipv4_address({127, 0, 0, 1}), 8080);
    platio::socket_address v6(boost::urls::ipv6_address::loopback(), 443);
    std::cout << v4.family() << " " << v4 << "\n";
    std::cout << v6.family() << " " << v6 << "\n";

    auto local = platio::socket_address::from_path("/tmp/platio.sock");
    if (local)
        std::cout << local->family() << " " << *local << "\n";

    auto mreq = platio::multicast_request::make(
        platio::inet_address(boost::urls::ipv4_address({224, 0, 0, 251}), 0));
    if (mreq)
        std::cout << *mreq << "\n";

    return EXIT_SUCCESS;
}
