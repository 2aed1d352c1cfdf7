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
#include "pfs/iomux/multiplexer.hpp"
#include <atomic>
#include <set>
#include <thread>
#include <vector>

using tcp_socket = iomux::posix::tcp_socket;
using multiplexer_t = iomux::multiplexer<tcp_socket>;

static char const * TAG = "iomux-test";

constexpr int const kWORKERS = 3;
constexpr int const kPER_WORKER = 50;

TEST_CASE("concurrent registration") {
    tools::tcp_listener listener {tools::loopback_saddr()};
    REQUIRE(listener.listen(256));

    std::vector<tools::socket_pair> pairs;
    pairs.reserve(kWORKERS * kPER_WORKER);

    for (int i = 0; i < kWORKERS * kPER_WORKER; i++) {
        pairs.push_back(tools::connect_pair(listener));
        REQUIRE(pairs.back().server);
    }

    LOGD(TAG, "Connections established: {}", pairs.size());

    multiplexer_t mux;
    std::atomic_int failures {0};
    std::vector<std::thread> workers;

    for (int w = 0; w < kWORKERS; w++) {
        workers.emplace_back([& mux, & pairs, & failures, w] {
            for (int i = w * kPER_WORKER; i < (w + 1) * kPER_WORKER; i++) {
                iomux::error err;

                if (!mux.add(pairs[i].server, & err))
                    ++failures;
            }
        });
    }

    for (auto & w: workers)
        w.join();

    CHECK_EQ(failures.load(), 0);
    CHECK_EQ(mux.size(), pairs.size());

    std::set<iomux::native_descriptor> fds;

    for (auto & p: pairs) {
        CHECK(mux.contains(p.server.native()));
        fds.insert(p.server.native());
    }

    // All descriptors are distinct
    CHECK_EQ(fds.size(), pairs.size());

    // Every registered connection is reported once data arrives
    for (auto & p: pairs)
        REQUIRE(tools::send_text(p.client, "ping"));

    std::set<tcp_socket *> reported;

    for (int i = 0; i < 50 && reported.size() < pairs.size(); i++) {
        auto ready = mux.wait(std::chrono::milliseconds{100});
        reported.insert(ready.begin(), ready.end());
    }

    CHECK_EQ(reported.size(), pairs.size());
}

TEST_CASE("registration while waiting") {
    int const kCONNECTIONS = 40;

    tools::tcp_listener listener {tools::loopback_saddr()};
    REQUIRE(listener.listen(64));

    std::vector<tools::socket_pair> pairs;
    pairs.reserve(kCONNECTIONS);

    for (int i = 0; i < kCONNECTIONS; i++) {
        pairs.push_back(tools::connect_pair(listener));
        REQUIRE(pairs.back().server);
        REQUIRE(tools::send_text(pairs.back().client, "data"));
    }

    std::set<tcp_socket *> known;

    for (auto & p: pairs)
        known.insert(& p.server);

    multiplexer_t mux;
    std::atomic_bool finish {false};
    std::atomic_int unknown {0};
    std::atomic_int stale {0};

    mux.on_stale = [& stale] (iomux::native_descriptor) { ++stale; };

    std::thread waiter {[& mux, & finish, & unknown, & known] {
        while (!finish.load()) {
            auto ready = mux.wait(std::chrono::milliseconds{5});

            for (auto conn: ready) {
                if (conn == nullptr || known.find(conn) == known.end())
                    ++unknown;
            }
        }
    }};

    // No assertions here: the waiter thread must be joined first
    int failures = 0;

    for (int round = 0; round < 20; round++) {
        for (auto & p: pairs) {
            iomux::error err;

            if (!mux.add(p.server, & err))
                failures++;
        }

        for (auto & p: pairs) {
            iomux::error err;

            if (!mux.remove(p.server, & err))
                failures++;
        }
    }

    finish.store(true);
    waiter.join();

    LOGD(TAG, "Stale descriptors skipped: {}", stale.load());

    CHECK_EQ(failures, 0);
    CHECK_EQ(unknown.load(), 0);
    CHECK(mux.empty());

    // After removal nothing is reported even though data is still pending
    CHECK(mux.wait(std::chrono::milliseconds{20}).empty());
}
