//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#include <boost/platio/socket_address.hpp>
#include <boost/platio/detail/except.hpp>
#include <boost/platio/detail/zeroed.hpp>

#include "src/detail/make_err.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <ostream>

#include <errno.h>
#include <netinet/in.h>
#include <sys/un.h>

namespace boost::platio {

namespace {

// Copy at most len bytes of a kernel supplied address into a
// zero filled struct of the family's type.
template<class Native>
Native
copy_native(::sockaddr const* sa, ::socklen_t len) noexcept
{
    auto out = detail::zeroed<Native>();
    std::memcpy(&out, sa,
        std::min(static_cast<std::size_t>(len), sizeof(Native)));
    return out;
}

} // namespace

std::ostream&
operator<<(std::ostream& os, address_family f)
{
    switch (f)
    {
    case address_family::unix_domain:
        return os << "AF_UNIX";
    case address_family::inet:
        return os << "AF_INET";
    case address_family::inet6:
        return os << "AF_INET6";
    }
    return os << "AF_" << static_cast<int>(f);
}

system::result<socket_address>
socket_address::
from_path(std::string_view path)
{
    auto r = unix_address::from_path(path);
    if (r.has_error())
        return r.error();
    return socket_address(*r);
}

system::result<socket_address>
socket_address::
from_native(
    ::sockaddr const* sa,
    ::socklen_t len)
{
    if (sa == nullptr ||
        static_cast<std::size_t>(len) <
            offsetof(::sockaddr, sa_family) + sizeof(::sa_family_t))
        return detail::make_err(EINVAL);

    // The family is read through the common initial member
    ::sa_family_t family = 0;
    std::memcpy(&family,
        reinterpret_cast<unsigned char const*>(sa) +
            offsetof(::sockaddr, sa_family),
        sizeof(family));

    switch (family)
    {
    case AF_INET:
        if (static_cast<std::size_t>(len) < sizeof(::sockaddr_in))
            return detail::make_err(EINVAL);
        return socket_address(inet_address(
            copy_native<::sockaddr_in>(sa, len)));

    case AF_INET6:
        if (static_cast<std::size_t>(len) < sizeof(::sockaddr_in6))
            return detail::make_err(EINVAL);
        return socket_address(inet_address(
            copy_native<::sockaddr_in6>(sa, len)));

    case AF_UNIX:
    {
        auto r = unix_address::from_native(
            copy_native<::sockaddr_un>(sa, len), len);
        if (r.has_error())
            return r.error();
        return socket_address(*r);
    }

    default:
        return detail::make_err(EAFNOSUPPORT);
    }
}

address_family
socket_address::
family() const noexcept
{
    if (is_unix())
        return address_family::unix_domain;
    return std::get<0>(v_).family();
}

inet_address const&
socket_address::
as_inet() const
{
    if (!is_inet())
        detail::throw_logic_error("socket_address is not an inet address");
    return std::get<0>(v_);
}

unix_address const&
socket_address::
as_unix() const
{
    if (!is_unix())
        detail::throw_logic_error("socket_address is not a unix address");
    return std::get<1>(v_);
}

::sockaddr const*
socket_address::
data() const noexcept
{
    return std::visit(
        [](auto const& a) { return a.data(); }, v_);
}

::socklen_t
socket_address::
size() const noexcept
{
    return std::visit(
        [](auto const& a) { return a.size(); }, v_);
}

std::string
socket_address::
to_string() const
{
    return std::visit(
        [](auto const& a) { return a.to_string(); }, v_);
}

std::size_t
hash_value(socket_address const& a) noexcept
{
    return std::visit(
        [](auto const& x) { return hash_value(x); }, a.v_);
}

std::ostream&
operator<<(
    std::ostream& os,
    socket_address const& a)
{
    return std::visit(
        [&os](auto const& x) -> std::ostream& { return os << x; }, a.v_);
}

} // namespace boost::platio
