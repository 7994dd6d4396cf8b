//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

#ifndef BOOST_PLATIO_DETAIL_CONFIG_HPP
#define BOOST_PLATIO_DETAIL_CONFIG_HPP

#include <boost/config.hpp>

#if defined(_WIN32)
# error "Boost.Platio requires a POSIX platform"
#endif

// Symbol visibility
#if (defined(BOOST_PLATIO_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && \
    !defined(BOOST_PLATIO_STATIC_LINK)
# if defined(BOOST_PLATIO_SOURCE)
#  define BOOST_PLATIO_DECL BOOST_SYMBOL_EXPORT
#  define BOOST_PLATIO_BUILD_DLL
# else
#  define BOOST_PLATIO_DECL BOOST_SYMBOL_IMPORT
# endif
#endif

#ifndef BOOST_PLATIO_DECL
# define BOOST_PLATIO_DECL
#endif

// Platforms whose socket address structs carry a length byte
#if defined(__APPLE__) || defined(__FreeBSD__) || defined(__DragonFly__) || \
    defined(__NetBSD__) || defined(__OpenBSD__)
# define BOOST_PLATIO_HAS_SOCKADDR_LEN 1
#endif

#endif
