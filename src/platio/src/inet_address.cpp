//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#include <boost/platio/inet_address.hpp>
#include <boost/platio/detail/except.hpp>
#include <boost/platio/detail/zeroed.hpp>
#include <boost/container_hash/hash.hpp>

#include <cstring>
#include <ostream>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace boost::platio {

namespace {

::sockaddr_in
make_sockaddr_in(urls::ipv4_address const& addr, std::uint16_t port) noexcept
{
    auto sa = detail::zeroed<::sockaddr_in>();
#if defined(BOOST_PLATIO_HAS_SOCKADDR_LEN)
    sa.sin_len = sizeof(::sockaddr_in);
#endif
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    auto const bytes = addr.to_bytes();
    static_assert(sizeof(sa.sin_addr) == sizeof(bytes));
    std::memcpy(&sa.sin_addr, bytes.data(), bytes.size());
    return sa;
}

// The 16 bytes of an ipv6_address are already the eight
// segments in network order, so they are copied verbatim.
::sockaddr_in6
make_sockaddr_in6(urls::ipv6_address const& addr, std::uint16_t port) noexcept
{
    auto sa = detail::zeroed<::sockaddr_in6>();
#if defined(BOOST_PLATIO_HAS_SOCKADDR_LEN)
    sa.sin6_len = sizeof(::sockaddr_in6);
#endif
    sa.sin6_family = AF_INET6;
    sa.sin6_port = htons(port);
    auto const bytes = addr.to_bytes();
    static_assert(sizeof(sa.sin6_addr) == sizeof(bytes));
    std::memcpy(&sa.sin6_addr, bytes.data(), bytes.size());
    return sa;
}

} // namespace

inet_address::
inet_address(urls::ipv4_address const& addr, std::uint16_t port) noexcept
    : sa_(make_sockaddr_in(addr, port))
{
}

inet_address::
inet_address(urls::ipv6_address const& addr, std::uint16_t port) noexcept
    : sa_(make_sockaddr_in6(addr, port))
{
}

inet_address::
inet_address(ip_address const& addr, std::uint16_t port) noexcept
    : sa_(std::holds_alternative<urls::ipv4_address>(addr)
        ? decltype(sa_)(make_sockaddr_in(
            std::get<urls::ipv4_address>(addr), port))
        : decltype(sa_)(make_sockaddr_in6(
            std::get<urls::ipv6_address>(addr), port)))
{
}

inet_address::
inet_address(::sockaddr_in const& sa) noexcept
    : sa_(detail::zeroed<::sockaddr_in>())
{
    auto& v4 = std::get<0>(sa_);
#if defined(BOOST_PLATIO_HAS_SOCKADDR_LEN)
    v4.sin_len = sizeof(::sockaddr_in);
#endif
    v4.sin_family = AF_INET;
    v4.sin_port = sa.sin_port;
    v4.sin_addr = sa.sin_addr;
}

inet_address::
inet_address(::sockaddr_in6 const& sa) noexcept
    : sa_(detail::zeroed<::sockaddr_in6>())
{
    auto& v6 = std::get<1>(sa_);
#if defined(BOOST_PLATIO_HAS_SOCKADDR_LEN)
    v6.sin6_len = sizeof(::sockaddr_in6);
#endif
    v6.sin6_family = AF_INET6;
    v6.sin6_port = sa.sin6_port;
    v6.sin6_flowinfo = sa.sin6_flowinfo;
    v6.sin6_addr = sa.sin6_addr;
    v6.sin6_scope_id = sa.sin6_scope_id;
}

ip_address
inet_address::
ip() const noexcept
{
    if (is_v4())
    {
        urls::ipv4_address::bytes_type bytes;
        std::memcpy(bytes.data(), &std::get<0>(sa_).sin_addr, bytes.size());
        return urls::ipv4_address(bytes);
    }
    urls::ipv6_address::bytes_type bytes;
    std::memcpy(bytes.data(), &std::get<1>(sa_).sin6_addr, bytes.size());
    return urls::ipv6_address(bytes);
}

urls::ipv4_address
inet_address::
v4_address() const
{
    if (!is_v4())
        detail::throw_logic_error("inet_address is not IPv4");
    return std::get<urls::ipv4_address>(ip());
}

urls::ipv6_address
inet_address::
v6_address() const
{
    if (!is_v6())
        detail::throw_logic_error("inet_address is not IPv6");
    return std::get<urls::ipv6_address>(ip());
}

std::uint16_t
inet_address::
port() const noexcept
{
    if (is_v4())
        return ntohs(std::get<0>(sa_).sin_port);
    return ntohs(std::get<1>(sa_).sin6_port);
}

std::uint32_t
inet_address::
flow_info() const noexcept
{
    if (is_v4())
        return 0;
    return ntohl(std::get<1>(sa_).sin6_flowinfo);
}

std::uint32_t
inet_address::
scope_id() const noexcept
{
    if (is_v4())
        return 0;
    return std::get<1>(sa_).sin6_scope_id;
}

::sockaddr_in const&
inet_address::
native_v4() const
{
    if (!is_v4())
        detail::throw_logic_error("inet_address is not IPv4");
    return std::get<0>(sa_);
}

::sockaddr_in6 const&
inet_address::
native_v6() const
{
    if (!is_v6())
        detail::throw_logic_error("inet_address is not IPv6");
    return std::get<1>(sa_);
}

::sockaddr const*
inet_address::
data() const noexcept
{
    if (is_v4())
        return reinterpret_cast<::sockaddr const*>(&std::get<0>(sa_));
    return reinterpret_cast<::sockaddr const*>(&std::get<1>(sa_));
}

::socklen_t
inet_address::
size() const noexcept
{
    if (is_v4())
        return sizeof(::sockaddr_in);
    return sizeof(::sockaddr_in6);
}

std::string
inet_address::
to_string() const
{
    std::ostringstream os;
    os << *this;
    return os.str();
}

bool
operator==(
    inet_address const& a,
    inet_address const& b) noexcept
{
    if (a.is_v4() && b.is_v4())
    {
        auto const& x = std::get<0>(a.sa_);
        auto const& y = std::get<0>(b.sa_);
        return x.sin_port == y.sin_port &&
            x.sin_addr.s_addr == y.sin_addr.s_addr;
    }
    if (a.is_v6() && b.is_v6())
    {
        auto const& x = std::get<1>(a.sa_);
        auto const& y = std::get<1>(b.sa_);
        return x.sin6_port == y.sin6_port &&
            std::memcmp(&x.sin6_addr, &y.sin6_addr,
                sizeof(x.sin6_addr)) == 0 &&
            x.sin6_flowinfo == y.sin6_flowinfo &&
            x.sin6_scope_id == y.sin6_scope_id;
    }
    return false;
}

std::size_t
hash_value(inet_address const& a) noexcept
{
    std::size_t seed = 0;
    boost::hash_combine(seed, static_cast<int>(a.family()));
    if (a.is_v4())
    {
        auto const& sa = std::get<0>(a.sa_);
        boost::hash_combine(seed, sa.sin_port);
        boost::hash_combine(seed, sa.sin_addr.s_addr);
        return seed;
    }
    auto const& sa = std::get<1>(a.sa_);
    boost::hash_combine(seed, sa.sin6_port);
    auto const* p = reinterpret_cast<unsigned char const*>(&sa.sin6_addr);
    boost::hash_range(seed, p, p + sizeof(sa.sin6_addr));
    boost::hash_combine(seed, sa.sin6_flowinfo);
    boost::hash_combine(seed, sa.sin6_scope_id);
    return seed;
}

std::ostream&
operator<<(
    std::ostream& os,
    inet_address const& a)
{
    if (a.is_v4())
        return os << a.v4_address().to_string() << ':' << a.port();
    return os << '[' << a.v6_address().to_string() << "]:" << a.port();
}

} // namespace boost::platio
