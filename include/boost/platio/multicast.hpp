//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_MULTICAST_HPP
#define BOOST_PLATIO_MULTICAST_HPP

#include <boost/platio/detail/config.hpp>
#include <boost/platio/inet_address.hpp>
#include <boost/system/result.hpp>
#include <boost/url/ipv4_address.hpp>

#include <iosfwd>
#include <optional>

#include <netinet/in.h>
#include <sys/socket.h>

namespace boost {
namespace platio {

/** An IPv4 multicast membership request.

    Wraps the `ip_mreq` passed to `setsockopt` with
    `IP_ADD_MEMBERSHIP` or `IP_DROP_MEMBERSHIP`. Both addresses are
    taken from inet_address values, which already hold them in
    network byte order.

    IPv6 groups are not supported by this structure.

    @par Example
    @code
    auto req = multicast_request::make(
        inet_address(urls::ipv4_address({224, 0, 0, 251}), 0)).value();
    ::setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP,
        req.data(), req.size());
    @endcode
*/
class BOOST_PLATIO_DECL multicast_request
{
    ::ip_mreq mreq_;

    explicit multicast_request(::ip_mreq const& mreq) noexcept
        : mreq_(mreq)
    {
    }

public:
    /** Construct a membership request.

        @param group The multicast group. Must be IPv4.
        @param iface The local interface. Must be IPv4 when
            present; when absent, `INADDR_ANY` lets the kernel
            choose.

        @return The request, or `errc::invalid_argument` if either
            address is IPv6.
    */
    static system::result<multicast_request> make(
        inet_address const& group,
        std::optional<inet_address> const& iface = std::nullopt);

    /// Return the group address.
    urls::ipv4_address group() const noexcept;

    /// Return the interface address.
    urls::ipv4_address interface_address() const noexcept;

    /// Return the wrapped native struct.
    ::ip_mreq const&
    native() const noexcept
    {
        return mreq_;
    }

    /// Return a pointer suitable for `setsockopt`.
    void const*
    data() const noexcept
    {
        return &mreq_;
    }

    /// Return the size of the native struct.
    ::socklen_t
    size() const noexcept
    {
        return sizeof(::ip_mreq);
    }

    /** Write a debug rendering.

        The form is
        `ip_mreq { imr_multiaddr: 224.0.0.251, imr_interface: 0.0.0.0 }`.
    */
    friend std::ostream& operator<<(
        std::ostream& os,
        multicast_request const& r);
};

} // namespace platio
} // namespace boost

#endif
