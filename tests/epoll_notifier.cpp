////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2026.10.15 Initial version.
//      2026.10.18 Concurrent close case.
////////////////////////////////////////////////////////////////////////////////
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "pfs/iomux/linux/epoll_notifier.hpp"
#include <array>
#include <cerrno>
#include <thread>
#include <vector>
#include <unistd.h>

using epoll_notifier = iomux::linux_os::epoll_notifier;

namespace {

class pipe_guard
{
public:
    int fds[2] = {-1, -1};

public:
    pipe_guard ()
    {
        REQUIRE_EQ(::pipe(fds), 0);
    }

    ~pipe_guard ()
    {
        ::close(fds[0]);
        ::close(fds[1]);
    }

    int reader () const noexcept { return fds[0]; }
    int writer () const noexcept { return fds[1]; }
};

} // namespace

TEST_CASE("readiness") {
    epoll_notifier notifier;
    pipe_guard p;
    std::array<epoll_notifier::event_type, 4> events;

    REQUIRE(notifier.native() >= 0);
    REQUIRE(notifier.add(p.reader()));

    CHECK_EQ(notifier.wait(events.data(), static_cast<int>(events.size()), 0), 0);

    char c = 'x';
    REQUIRE_EQ(::write(p.writer(), & c, 1), 1);

    auto n = notifier.wait(events.data(), static_cast<int>(events.size()), 1000);

    REQUIRE_EQ(n, 1);
    CHECK_EQ(epoll_notifier::descriptor(events[0]), p.reader());
    CHECK(events[0].events & EPOLLIN);

    // Level-triggered: still ready while not drained
    CHECK_EQ(notifier.wait(events.data(), static_cast<int>(events.size()), 0), 1);

    REQUIRE(notifier.remove(p.reader()));
    CHECK_EQ(notifier.wait(events.data(), static_cast<int>(events.size()), 0), 0);
}

TEST_CASE("strict registration") {
    epoll_notifier notifier;
    pipe_guard p;
    iomux::error err;

    REQUIRE(notifier.add(p.reader()));

    CHECK_FALSE(notifier.add(p.reader(), epoll_notifier::DEFAULT_INTEREST, & err));
    CHECK_EQ(err.code(), iomux::make_error_code(iomux::errc::registration_error));

    err = iomux::error{};

    CHECK(notifier.remove(p.reader(), & err));
    CHECK_FALSE(err);

    CHECK_FALSE(notifier.remove(p.reader(), & err));
    CHECK_EQ(err.code(), iomux::make_error_code(iomux::errc::registration_error));

    CHECK_THROWS_AS(notifier.remove(p.writer()), iomux::error);
    CHECK_THROWS_AS(notifier.add(-1), iomux::error);
}

TEST_CASE("close") {
    epoll_notifier notifier;
    pipe_guard p;
    std::array<epoll_notifier::event_type, 1> events;

    notifier.close();
    CHECK_EQ(notifier.native(), -1);

    // Idempotent
    notifier.close();

    iomux::error err;
    CHECK_FALSE(notifier.add(p.reader(), epoll_notifier::DEFAULT_INTEREST, & err));
    CHECK_EQ(err.code(), iomux::make_error_code(iomux::errc::registration_error));

    auto rc = notifier.wait(events.data(), 1, 0);
    auto saved_errno = errno;

    CHECK_EQ(rc, -1);
    CHECK_EQ(saved_errno, EBADF);
}

TEST_CASE("concurrent close") {
    epoll_notifier notifier;
    std::vector<std::thread> threads;

    for (int i = 0; i < 4; i++)
        threads.emplace_back([& notifier] { notifier.close(); });

    for (auto & t: threads)
        t.join();

    CHECK_EQ(notifier.native(), -1);
}
