////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2026.10.15 Initial version.
////////////////////////////////////////////////////////////////////////////////
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "pfs/iomux/descriptor_table.hpp"
#include <thread>
#include <vector>

namespace {

struct fake_connection
{
    int id {0};
};

constexpr int const kTHREADS = 4;
constexpr int const kPER_THREAD = 1000;

} // namespace

using table_t = iomux::descriptor_table<fake_connection>;

TEST_CASE("basic") {
    table_t table;
    fake_connection a {1};
    fake_connection b {2};

    CHECK(table.empty());
    CHECK(table.find(3) == nullptr);

    CHECK_EQ(table.insert(3, a), 1);
    CHECK_EQ(table.insert(4, b), 2);

    CHECK(table.contains(3));
    CHECK(table.contains(4));
    CHECK_EQ(table.find(3), & a);
    CHECK_EQ(table.find(4), & b);

    // Descriptor reused for another connection
    CHECK_EQ(table.insert(3, b), 2);
    CHECK_EQ(table.find(3), & b);

    CHECK_EQ(table.erase(3), 1);
    CHECK_FALSE(table.contains(3));

    // Erasing absent descriptor keeps the table intact
    CHECK_EQ(table.erase(3), 1);

    table.clear();
    CHECK(table.empty());
}

TEST_CASE("resolve") {
    table_t table;
    fake_connection a {1};
    fake_connection b {2};
    fake_connection c {3};

    table.insert(10, a);
    table.insert(11, b);
    table.insert(12, c);

    std::vector<fake_connection *> found;
    std::vector<iomux::native_descriptor> missed;

    table.resolve(std::vector<iomux::native_descriptor>{12, 42, 10, 11, 43}, found, missed);

    REQUIRE_EQ(found.size(), 3);
    CHECK_EQ(found[0], & c);
    CHECK_EQ(found[1], & a);
    CHECK_EQ(found[2], & b);

    REQUIRE_EQ(missed.size(), 2);
    CHECK_EQ(missed[0], 42);
    CHECK_EQ(missed[1], 43);
}

TEST_CASE("concurrent insert and erase") {
    table_t table;
    std::vector<fake_connection> connections(kTHREADS * kPER_THREAD);
    std::vector<std::thread> threads;

    for (int t = 0; t < kTHREADS; t++) {
        threads.emplace_back([& table, & connections, t] {
            for (int i = 0; i < kPER_THREAD; i++) {
                auto fd = t * kPER_THREAD + i;
                connections[fd].id = fd;
                table.insert(fd, connections[fd]);
            }
        });
    }

    for (auto & th: threads)
        th.join();

    REQUIRE_EQ(table.size(), kTHREADS * kPER_THREAD);

    for (int fd = 0; fd < kTHREADS * kPER_THREAD; fd++)
        CHECK_EQ(table.find(fd), & connections[fd]);

    threads.clear();

    // Erase odd descriptors while readers resolve even ones
    threads.emplace_back([& table] {
        for (int fd = 1; fd < kTHREADS * kPER_THREAD; fd += 2)
            table.erase(fd);
    });

    threads.emplace_back([& table] {
        std::vector<iomux::native_descriptor> fds;

        for (int fd = 0; fd < kTHREADS * kPER_THREAD; fd += 2)
            fds.push_back(fd);

        for (int i = 0; i < 10; i++) {
            std::vector<fake_connection *> found;
            std::vector<iomux::native_descriptor> missed;

            table.resolve(fds, found, missed);

            CHECK_EQ(found.size(), fds.size());
            CHECK(missed.empty());
        }
    });

    for (auto & th: threads)
        th.join();

    CHECK_EQ(table.size(), kTHREADS * kPER_THREAD / 2);
}
