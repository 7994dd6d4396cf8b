//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_ADDRESS_FAMILY_HPP
#define BOOST_PLATIO_ADDRESS_FAMILY_HPP

#include <boost/platio/detail/config.hpp>

#include <iosfwd>

#include <sys/socket.h>

namespace boost {
namespace platio {

/// The address families a socket_address can hold.
enum class address_family : int
{
    /// Unix domain sockets (AF_UNIX).
    unix_domain = AF_UNIX,

    /// IPv4 (AF_INET).
    inet = AF_INET,

    /// IPv6 (AF_INET6).
    inet6 = AF_INET6
};

/// Write the family name, for example `AF_INET6`.
BOOST_PLATIO_DECL
std::ostream&
operator<<(std::ostream& os, address_family f);

} // namespace platio
} // namespace boost

#endif
