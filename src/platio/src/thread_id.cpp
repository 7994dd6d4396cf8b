//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#include <boost/platio/thread_id.hpp>

#include <pthread.h>

namespace boost::platio {

thread_id
this_thread_id() noexcept
{
    return ::pthread_self();
}

} // namespace boost::platio
