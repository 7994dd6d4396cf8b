//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_SOCKET_ADDRESS_HPP
#define BOOST_PLATIO_SOCKET_ADDRESS_HPP

#include <boost/platio/detail/config.hpp>
#include <boost/platio/address_family.hpp>
#include <boost/platio/inet_address.hpp>
#include <boost/platio/unix_address.hpp>
#include <boost/system/result.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <variant>

#include <sys/socket.h>

/*
    Socket Address
    ==============

    socket_address is a tagged union of exactly two alternatives:

      inet_address  - sockaddr_in or sockaddr_in6
      unix_address  - sockaddr_un

    Each alternative owns its native encoding, so the family tag
    inside the native struct always matches the alternative. The
    data()/size() pair is the only view handed to the kernel; it
    is read only and sized to the active struct.

    Comparison, hashing and rendering dispatch on the alternative.
    Addresses of different families are never equal.
*/

namespace boost {
namespace platio {

/** An IPv4, IPv6 or Unix domain socket address.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Safe (immutable after construction).

    @par Example
    @code
    socket_address a(urls::ipv6_address::loopback(), 443);
    ::connect(fd, a.data(), a.size());
    @endcode
*/
class BOOST_PLATIO_DECL socket_address
{
    std::variant<inet_address, unix_address> v_;

public:
    /// Construct the IPv4 unspecified address, port zero.
    socket_address() = default;

    /// Construct from an IP socket address.
    socket_address(inet_address const& a) noexcept
        : v_(a)
    {
    }

    /// Construct from a Unix domain socket address.
    socket_address(unix_address const& a) noexcept
        : v_(a)
    {
    }

    /** Construct from an IP address and port.

        @param addr The address; its version selects the encoding.
        @param port The port, in host byte order.
    */
    socket_address(ip_address const& addr, std::uint16_t port) noexcept
        : v_(inet_address(addr, port))
    {
    }

    /** Construct a Unix domain address for a path.

        @see unix_address::from_path
    */
    static system::result<socket_address> from_path(std::string_view path);

    /// Construct a Unix domain address for a filesystem path.
    template<class Path>
        requires std::same_as<Path, std::filesystem::path>
    static system::result<socket_address>
    from_path(Path const& path)
    {
        return from_path(std::string_view(path.native()));
    }

    /** Decode a native address supplied by the kernel.

        @param sa The native address, for example as filled in by
            `accept` or `getsockname`.
        @param len The length reported with it.

        @return The address, or an error:
            - `errc::invalid_argument` if `sa` is null or `len` is
              too short for the family,
            - `errc::address_family_not_supported` for other families.
    */
    static system::result<socket_address> from_native(
        ::sockaddr const* sa,
        ::socklen_t len);

    /// Return the address family.
    address_family family() const noexcept;

    /// Return true if this holds an inet_address.
    bool
    is_inet() const noexcept
    {
        return v_.index() == 0;
    }

    /// Return true if this holds a unix_address.
    bool
    is_unix() const noexcept
    {
        return v_.index() == 1;
    }

    /** Return the IP socket address.

        @throws std::logic_error if `!is_inet()`.
    */
    inet_address const& as_inet() const;

    /** Return the Unix domain socket address.

        @throws std::logic_error if `!is_unix()`.
    */
    unix_address const& as_unix() const;

    /// Return a pointer suitable for address consuming calls.
    ::sockaddr const* data() const noexcept;

    /// Return the size of the active native struct.
    ::socklen_t size() const noexcept;

    /// Return the textual form: `a.b.c.d:port`, `[v6]:port` or the path.
    std::string to_string() const;

    friend bool
    operator==(
        socket_address const& a,
        socket_address const& b) noexcept
    {
        return a.v_ == b.v_;
    }

    friend bool
    operator!=(
        socket_address const& a,
        socket_address const& b) noexcept
    {
        return !(a == b);
    }

    friend std::size_t hash_value(socket_address const& a) noexcept;

    friend std::ostream& operator<<(
        std::ostream& os,
        socket_address const& a);
};

} // namespace platio
} // namespace boost

template<>
struct std::hash<boost::platio::socket_address>
{
    std::size_t
    operator()(boost::platio::socket_address const& a) const noexcept
    {
        return hash_value(a);
    }
};

#endif
