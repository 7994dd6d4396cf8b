//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_UNIX_ADDRESS_HPP
#define BOOST_PLATIO_UNIX_ADDRESS_HPP

#include <boost/platio/detail/config.hpp>
#include <boost/system/result.hpp>

#include <concepts>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

#include <sys/socket.h>
#include <sys/un.h>

namespace boost {
namespace platio {

/** A Unix domain socket address.

    The path is stored in a zero filled `sockaddr_un`. A path must
    leave room for its terminator, so its length is strictly less
    than the capacity of `sun_path`.

    Equality and hashing use the decoded path; bytes after the
    terminator never take part.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Safe (immutable after construction).
*/
class BOOST_PLATIO_DECL unix_address
{
    ::sockaddr_un sa_;

    explicit unix_address(::sockaddr_un const& sa) noexcept
        : sa_(sa)
    {
    }

public:
    /// The number of bytes in `sun_path`, terminator included.
    static constexpr std::size_t capacity =
        sizeof(::sockaddr_un{}.sun_path);

    /** Construct an address for a path.

        @param path The path bytes, without a terminator.

        @return The address, or an error:
            - `errc::filename_too_long` if `path.size() >= capacity`,
            - `errc::invalid_argument` if `path` contains a NUL byte.
    */
    static system::result<unix_address> from_path(std::string_view path);

    /** Construct an address for a filesystem path.

        Constrained so that strings and literals select the
        `std::string_view` overload.
    */
    template<class Path>
        requires std::same_as<Path, std::filesystem::path>
    static system::result<unix_address>
    from_path(Path const& path)
    {
        return from_path(std::string_view(path.native()));
    }

    /** Construct from a native address supplied by the kernel.

        @param sa The native address.
        @param len The length reported with it.

        @return The address, or `errc::address_family_not_supported`
            if `sa` is not AF_UNIX, or `errc::invalid_argument` if
            `len` does not cover the family field.
    */
    static system::result<unix_address> from_native(
        ::sockaddr_un const& sa,
        ::socklen_t len);

    /// Return the path, up to the first NUL.
    std::string_view path() const noexcept;

    /// Return the wrapped native struct.
    ::sockaddr_un const&
    native() const noexcept
    {
        return sa_;
    }

    /// Return a pointer suitable for address consuming calls.
    ::sockaddr const*
    data() const noexcept
    {
        return reinterpret_cast<::sockaddr const*>(&sa_);
    }

    /// Return the size of the native struct.
    ::socklen_t
    size() const noexcept
    {
        return sizeof(::sockaddr_un);
    }

    /// Return the path as a string.
    std::string
    to_string() const
    {
        return std::string(path());
    }

    friend bool
    operator==(
        unix_address const& a,
        unix_address const& b) noexcept
    {
        return a.path() == b.path();
    }

    friend bool
    operator!=(
        unix_address const& a,
        unix_address const& b) noexcept
    {
        return !(a == b);
    }

    friend std::size_t hash_value(unix_address const& a) noexcept;

    friend std::ostream& operator<<(
        std::ostream& os,
        unix_address const& a);
};

} // namespace platio
} // namespace boost

template<>
struct std::hash<boost::platio::unix_address>
{
    std::size_t
    operator()(boost::platio::unix_address const& a) const noexcept
    {
        return hash_value(a);
    }
};

#endif
