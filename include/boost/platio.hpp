//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_HPP
#define BOOST_PLATIO_HPP

#include <boost/platio/address_family.hpp>
#include <boost/platio/inet_address.hpp>
#include <boost/platio/multicast.hpp>
#include <boost/platio/signal.hpp>
#include <boost/platio/signal_action.hpp>
#include <boost/platio/signal_info.hpp>
#include <boost/platio/signal_set.hpp>
#include <boost/platio/signals.hpp>
#include <boost/platio/socket_address.hpp>
#include <boost/platio/thread_id.hpp>
#include <boost/platio/unix_address.hpp>

#endif
