//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_INET_ADDRESS_HPP
#define BOOST_PLATIO_INET_ADDRESS_HPP

#include <boost/platio/detail/config.hpp>
#include <boost/platio/address_family.hpp>
#include <boost/url/ipv4_address.hpp>
#include <boost/url/ipv6_address.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <variant>

#include <netinet/in.h>
#include <sys/socket.h>

namespace boost {
namespace platio {

/// A portable IP address, either version.
using ip_address = std::variant<urls::ipv4_address, urls::ipv6_address>;

/** An IPv4 or IPv6 socket address.

    The address is held in its native encoding, a `sockaddr_in` or
    a `sockaddr_in6`, with the port and address in network byte
    order. Accessors convert to host order.

    Every constructor zero fills the native struct before setting
    the family, port and address, so padding such as `sin_zero`
    is always zero. Comparison and hashing never look at padding.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Safe (immutable after construction).

    @par Example
    @code
    inet_address a(urls::ipv4_address({127, 0, 0, 1}), 8080);
    std::cout << a;     // 127.0.0.1:8080
    @endcode
*/
class BOOST_PLATIO_DECL inet_address
{
    std::variant<::sockaddr_in, ::sockaddr_in6> sa_;

public:
    /// Construct the IPv4 unspecified address, port zero.
    inet_address() noexcept
        : inet_address(urls::ipv4_address(), 0)
    {
    }

    /** Construct an IPv4 address.

        @param addr The address.
        @param port The port, in host byte order.
    */
    inet_address(urls::ipv4_address const& addr, std::uint16_t port) noexcept;

    /** Construct an IPv6 address.

        @param addr The address.
        @param port The port, in host byte order.
    */
    inet_address(urls::ipv6_address const& addr, std::uint16_t port) noexcept;

    /** Construct from a portable address and port.

        The native encoding is chosen by the address version.
    */
    inet_address(ip_address const& addr, std::uint16_t port) noexcept;

    /** Construct from a native IPv4 address.

        The family, port and address are copied field by field.
    */
    explicit inet_address(::sockaddr_in const& sa) noexcept;

    /** Construct from a native IPv6 address.

        The family, port, address, flow information and scope
        id are copied field by field.
    */
    explicit inet_address(::sockaddr_in6 const& sa) noexcept;

    /// Return true if this is an IPv4 address.
    bool
    is_v4() const noexcept
    {
        return sa_.index() == 0;
    }

    /// Return true if this is an IPv6 address.
    bool
    is_v6() const noexcept
    {
        return sa_.index() == 1;
    }

    /// Return `address_family::inet` or `address_family::inet6`.
    address_family
    family() const noexcept
    {
        return is_v4() ? address_family::inet : address_family::inet6;
    }

    /// Return the address.
    ip_address ip() const noexcept;

    /** Return the IPv4 address.

        @throws std::logic_error if `is_v6()`.
    */
    urls::ipv4_address v4_address() const;

    /** Return the IPv6 address.

        @throws std::logic_error if `is_v4()`.
    */
    urls::ipv6_address v6_address() const;

    /// Return the port in host byte order.
    std::uint16_t port() const noexcept;

    /// Return the IPv6 flow information, or zero for IPv4.
    std::uint32_t flow_info() const noexcept;

    /// Return the IPv6 scope id, or zero for IPv4.
    std::uint32_t scope_id() const noexcept;

    /// Return the native IPv4 struct. Requires `is_v4()`.
    ::sockaddr_in const& native_v4() const;

    /// Return the native IPv6 struct. Requires `is_v6()`.
    ::sockaddr_in6 const& native_v6() const;

    /// Return a pointer suitable for address consuming calls.
    ::sockaddr const* data() const noexcept;

    /// Return the size of the active native struct.
    ::socklen_t size() const noexcept;

    /// Return `a.b.c.d:port` or `[v6]:port`.
    std::string to_string() const;

    friend bool operator==(
        inet_address const& a,
        inet_address const& b) noexcept;

    friend bool
    operator!=(
        inet_address const& a,
        inet_address const& b) noexcept
    {
        return !(a == b);
    }

    friend std::size_t hash_value(inet_address const& a) noexcept;

    friend std::ostream& operator<<(
        std::ostream& os,
        inet_address const& a);
};

} // namespace platio
} // namespace boost

template<>
struct std::hash<boost::platio::inet_address>
{
    std::size_t
    operator()(boost::platio::inet_address const& a) const noexcept
    {
        return hash_value(a);
    }
};

#endif
