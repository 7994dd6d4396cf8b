//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_SIGNAL_SET_HPP
#define BOOST_PLATIO_SIGNAL_SET_HPP

#include <boost/platio/detail/config.hpp>
#include <boost/platio/detail/platform_signals.hpp>
#include <boost/system/result.hpp>

#include <signal.h>

namespace boost {
namespace platio {

/** A set of signal numbers.

    This is a value type wrapping the platform's `sigset_t`. Its
    capacity and bit layout are those of the target platform (see
    `detail::platform_signals::sigset_bits`).

    A signal set is never observable in an uninitialized state:
    every constructor clears or fills the native set through the
    C library before returning.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Unsafe.

    @par Example
    @code
    signal_set set;
    set.add(sigusr1).value();
    auto old = set_thread_mask(mask_how::block, set).value();
    @endcode
*/
class BOOST_PLATIO_DECL signal_set
{
    ::sigset_t set_;

    explicit signal_set(bool full);

public:
    using native_type = ::sigset_t;

    /** Construct an empty signal set.

        @throws boost::system::system_error if the C library
        rejects the initialization.
    */
    signal_set();

    /** Construct from a native set.

        The native value is copied as is. It must have been
        produced by the C library or the kernel.
    */
    explicit signal_set(::sigset_t const& native) noexcept
        : set_(native)
    {
    }

    /** Return a set containing no signals. */
    static signal_set empty()
    {
        return signal_set(false);
    }

    /** Return a set containing every signal. */
    static signal_set all()
    {
        return signal_set(true);
    }

    /** Add a signal to the set.

        The range check is the one `sigaddset` performs.

        @param signal_number The signal to add.

        @return Success, or the error reported by the C library,
            typically `errc::invalid_argument`.
    */
    system::result<void> add(int signal_number);

    /** Remove a signal from the set.

        @param signal_number The signal to remove.

        @return Success, or the error reported by the C library.
    */
    system::result<void> remove(int signal_number);

    /** Test whether a signal is in the set.

        @param signal_number The signal to test.

        @return `true` if present, or the error reported by the
            C library for an invalid signal number.
    */
    system::result<bool> contains(int signal_number) const;

    /// Return the wrapped native set.
    ::sigset_t const&
    native() const noexcept
    {
        return set_;
    }
};

} // namespace platio
} // namespace boost

#endif
