//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_THREAD_ID_HPP
#define BOOST_PLATIO_THREAD_ID_HPP

#include <boost/platio/detail/config.hpp>

#include <pthread.h>

namespace boost {
namespace platio {

/// An opaque identifier for a thread, usable as a signal target.
using thread_id = ::pthread_t;

/// Return the identifier of the calling thread.
BOOST_PLATIO_DECL thread_id this_thread_id() noexcept;

} // namespace platio
} // namespace boost

#endif
