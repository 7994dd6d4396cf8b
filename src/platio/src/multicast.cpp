//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#include <boost/platio/multicast.hpp>
#include <boost/platio/detail/zeroed.hpp>

#include "src/detail/make_err.hpp"

#include <cstring>
#include <ostream>

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>

namespace boost::platio {

namespace {

urls::ipv4_address
to_ipv4(::in_addr const& a) noexcept
{
    urls::ipv4_address::bytes_type bytes;
    std::memcpy(bytes.data(), &a, bytes.size());
    return urls::ipv4_address(bytes);
}

} // namespace

system::result<multicast_request>
multicast_request::
make(
    inet_address const& group,
    std::optional<inet_address> const& iface)
{
    if (!group.is_v4())
        return detail::make_err(EINVAL);
    if (iface && !iface->is_v4())
        return detail::make_err(EINVAL);

    auto mreq = detail::zeroed<::ip_mreq>();
    mreq.imr_multiaddr = group.native_v4().sin_addr;
    if (iface)
        mreq.imr_interface = iface->native_v4().sin_addr;
    else
        mreq.imr_interface.s_addr = htonl(INADDR_ANY);
    return multicast_request(mreq);
}

urls::ipv4_address
multicast_request::
group() const noexcept
{
    return to_ipv4(mreq_.imr_multiaddr);
}

urls::ipv4_address
multicast_request::
interface_address() const noexcept
{
    return to_ipv4(mreq_.imr_interface);
}

std::ostream&
operator<<(
    std::ostream& os,
    multicast_request const& r)
{
    return os <<
        "ip_mreq { imr_multiaddr: " << r.group().to_string() <<
        ", imr_interface: " << r.interface_address().to_string() << " }";
}

} // namespace boost::platio
