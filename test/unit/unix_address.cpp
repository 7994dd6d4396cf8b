//
// Copyright (c) 2026 Steve Gerbino
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/platio
//

// Test that header file is self-contained.
#include <boost/platio/unix_address.hpp>

#include <boost/core/lightweight_test.hpp>
#include <boost/system/errc.hpp>

#include <cstddef>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>

#include <sys/socket.h>
#include <sys/un.h>

namespace boost::platio {

//------------------------------------------------
// Unix domain socket address tests
// Focus: path capacity, NUL handling, native decoding
//------------------------------------------------

struct unix_address_test
{
    void
    testFromPath()
    {
        auto r = unix_address::from_path("/tmp/sock");
        BOOST_TEST(r.has_value());
        BOOST_TEST_EQ(r->path(), "/tmp/sock");
        BOOST_TEST_EQ(r->to_string(), "/tmp/sock");
        BOOST_TEST_EQ(r->native().sun_family, AF_UNIX);
        BOOST_TEST_EQ(r->size(), sizeof(::sockaddr_un));
        BOOST_TEST(
            static_cast<void const*>(r->data()) ==
            static_cast<void const*>(&r->native()));
    }

    void
    testFromFilesystemPath()
    {
        std::filesystem::path p("/var/run/app.sock");
        auto r = unix_address::from_path(p);
        BOOST_TEST(r.has_value());
        BOOST_TEST_EQ(r->path(), "/var/run/app.sock");
    }

    void
    testFromStringForms()
    {
        std::string s("/tmp/owned.sock");
        std::string const cs("/tmp/const.sock");
        std::string_view sv("/tmp/view.sock");
        std::filesystem::path const fp("/tmp/fs.sock");

        BOOST_TEST_EQ(
            unix_address::from_path("/tmp/lit.sock")->path(), "/tmp/lit.sock");
        BOOST_TEST_EQ(unix_address::from_path(s)->path(), s);
        BOOST_TEST_EQ(unix_address::from_path(cs)->path(), cs);
        BOOST_TEST_EQ(unix_address::from_path(sv)->path(), sv);
        BOOST_TEST_EQ(unix_address::from_path(fp)->path(), "/tmp/fs.sock");
    }

    void
    testEmptyPath()
    {
        auto r = unix_address::from_path(std::string_view());
        BOOST_TEST(r.has_value());
        BOOST_TEST(r->path().empty());
    }

    void
    testCapacity()
    {
        // One byte is reserved for the terminator
        std::string longest(unix_address::capacity - 1, 'a');
        auto ok = unix_address::from_path(longest);
        BOOST_TEST(ok.has_value());
        BOOST_TEST_EQ(ok->path(), longest);
        BOOST_TEST_EQ(ok->native().sun_path[longest.size()], '\0');

        std::string too_long(unix_address::capacity, 'a');
        auto bad = unix_address::from_path(too_long);
        BOOST_TEST(bad.has_error());
        BOOST_TEST(bad.error() == system::errc::filename_too_long);
    }

    void
    testEmbeddedNul()
    {
        std::string s("/tmp/a");
        s.push_back('\0');
        s += "b";
        auto r = unix_address::from_path(s);
        BOOST_TEST(r.has_error());
        BOOST_TEST(r.error() == system::errc::invalid_argument);
    }

    void
    testFromNativeStopsAtNul()
    {
        ::sockaddr_un sa;
        std::memset(&sa, 'x', sizeof(sa));
        sa.sun_family = AF_UNIX;
        std::memcpy(sa.sun_path, "/tmp/s\0garbage", 14);

        auto r = unix_address::from_native(sa, sizeof(sa));
        BOOST_TEST(r.has_value());
        BOOST_TEST_EQ(r->path(), "/tmp/s");

        // Garbage after the terminator does not affect equality
        auto expected = unix_address::from_path("/tmp/s");
        BOOST_TEST(*r == *expected);
        BOOST_TEST_EQ(hash_value(*r), hash_value(*expected));
    }

    void
    testFromNativeHonorsLength()
    {
        ::sockaddr_un sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sun_family = AF_UNIX;
        std::memcpy(sa.sun_path, "/tmp/abcdef", 11);

        // Length covering only "/tmp/abc" without a terminator
        auto len = static_cast<::socklen_t>(
            offsetof(::sockaddr_un, sun_path) + 8);
        auto r = unix_address::from_native(sa, len);
        BOOST_TEST(r.has_value());
        BOOST_TEST_EQ(r->path(), "/tmp/abc");
    }

    void
    testFromNativeErrors()
    {
        ::sockaddr_un sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sun_family = AF_INET;

        auto wrong = unix_address::from_native(sa, sizeof(sa));
        BOOST_TEST(wrong.has_error());
        BOOST_TEST(
            wrong.error() == system::errc::address_family_not_supported);

        sa.sun_family = AF_UNIX;
        auto shorty = unix_address::from_native(sa, 1);
        BOOST_TEST(shorty.has_error());
        BOOST_TEST(shorty.error() == system::errc::invalid_argument);
    }

    void
    testEquality()
    {
        auto a = unix_address::from_path("/tmp/a").value();
        auto b = unix_address::from_path("/tmp/a").value();
        auto c = unix_address::from_path("/tmp/b").value();

        BOOST_TEST(a == b);
        BOOST_TEST(a != c);
        BOOST_TEST_EQ(
            std::hash<unix_address>()(a),
            std::hash<unix_address>()(b));
    }

    void
    testStream()
    {
        std::ostringstream os;
        os << unix_address::from_path("/run/x.sock").value();
        BOOST_TEST_EQ(os.str(), "/run/x.sock");
    }

    void
    run()
    {
        testFromPath();
        testFromFilesystemPath();
        testFromStringForms();
        testEmptyPath();
        testCapacity();
        testEmbeddedNul();
        testFromNativeStopsAtNul();
        testFromNativeHonorsLength();
        testFromNativeErrors();
        testEquality();
        testStream();
    }
};

} // namespace boost::platio

int
main()
{
    boost::platio::unix_address_test().run();
    return boost::report_errors();
}
