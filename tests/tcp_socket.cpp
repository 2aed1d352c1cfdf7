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
#include "tools.hpp"
#include "pfs/iomux/descriptor_accessor.hpp"
#include <utility>

using tcp_socket = iomux::posix::tcp_socket;

TEST_CASE("listener") {
    tools::tcp_listener listener {tools::loopback_saddr()};

    REQUIRE(listener);
    REQUIRE(listener.listen(10));

    CHECK(listener.saddr().port != 0);
    CHECK(iomux::is_loopback(listener.saddr().addr));

    // No pending connections
    CHECK_FALSE(listener.accept());
}

TEST_CASE("exchange") {
    tools::tcp_listener listener {tools::loopback_saddr()};
    REQUIRE(listener.listen(10));

    auto pair = tools::connect_pair(listener);

    REQUIRE(pair.client);
    REQUIRE(pair.server);
    CHECK(is_loopback(pair.server.saddr().addr));

    REQUIRE(tools::send_text(pair.client, "hello"));

    std::string received;

    for (int i = 0; i < 100 && received.size() < 5; i++) {
        received += tools::drain(pair.server);

        if (received.size() < 5)
            std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }

    CHECK_EQ(received, std::string{"hello"});

    CHECK_NOTHROW(pair.client.disconnect());
}

TEST_CASE("descriptor accessor") {
    tools::tcp_listener listener {tools::loopback_saddr()};
    REQUIRE(listener.listen(10));

    auto pair = tools::connect_pair(listener);
    REQUIRE(pair.server);

    auto fd = iomux::descriptor_accessor<tcp_socket>::extract(pair.server);
    CHECK_EQ(fd, pair.server.native());

    tcp_socket moved = std::move(pair.server);

    CHECK_FALSE(pair.server);
    CHECK_EQ(moved.native(), fd);

    iomux::error err;

    CHECK_EQ(iomux::descriptor_accessor<tcp_socket>::extract(pair.server, & err)
        , iomux::kINVALID_DESCRIPTOR);
    CHECK_EQ(err.code(), iomux::make_error_code(iomux::errc::descriptor_extraction_error));

    moved.close();
    CHECK_FALSE(moved);
    CHECK_THROWS_AS(iomux::descriptor_accessor<tcp_socket>::extract(moved), iomux::error);
}
