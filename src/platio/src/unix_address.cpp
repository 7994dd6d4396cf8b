//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#include <boost/platio/unix_address.hpp>
#include <boost/platio/address_family.hpp>
#include <boost/platio/detail/zeroed.hpp>
#include <boost/container_hash/hash.hpp>

#include "src/detail/make_err.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <ostream>

#include <errno.h>

namespace boost::platio {

system::result<unix_address>
unix_address::
from_path(std::string_view path)
{
    if (path.size() >= capacity)
        return detail::make_err(ENAMETOOLONG);
    if (path.find('\0') != std::string_view::npos)
        return detail::make_err(EINVAL);

    auto sa = detail::zeroed<::sockaddr_un>();
#if defined(BOOST_PLATIO_HAS_SOCKADDR_LEN)
    sa.sun_len = sizeof(::sockaddr_un);
#endif
    sa.sun_family = AF_UNIX;

    // The zero fill supplies the terminator
    std::memcpy(sa.sun_path, path.data(), path.size());
    return unix_address(sa);
}

system::result<unix_address>
unix_address::
from_native(
    ::sockaddr_un const& sa,
    ::socklen_t len)
{
    constexpr auto path_offset = offsetof(::sockaddr_un, sun_path);
    if (static_cast<std::size_t>(len) < path_offset)
        return detail::make_err(EINVAL);
    if (sa.sun_family != AF_UNIX)
        return detail::make_err(EAFNOSUPPORT);

    auto copy = detail::zeroed<::sockaddr_un>();
#if defined(BOOST_PLATIO_HAS_SOCKADDR_LEN)
    copy.sun_len = sizeof(::sockaddr_un);
#endif
    copy.sun_family = AF_UNIX;

    // Bytes past len are not part of the address
    auto const n = std::min(
        static_cast<std::size_t>(len) - path_offset, capacity);
    std::memcpy(copy.sun_path, sa.sun_path, n);
    return unix_address(copy);
}

std::string_view
unix_address::
path() const noexcept
{
    auto const* first = sa_.sun_path;
    auto const* last = std::find(first, first + capacity, '\0');
    return std::string_view(first, static_cast<std::size_t>(last - first));
}

std::size_t
hash_value(unix_address const& a) noexcept
{
    std::size_t seed = 0;
    boost::hash_combine(seed, static_cast<int>(address_family::unix_domain));
    boost::hash_combine(seed, std::hash<std::string_view>()(a.path()));
    return seed;
}

std::ostream&
operator<<(
    std::ostream& os,
    unix_address const& a)
{
    return os << a.path();
}

} // namespace boost::platio
