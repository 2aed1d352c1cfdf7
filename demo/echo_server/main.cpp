////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2023.01.01 Initial version.
//      2026.10.16 Echo server on top of multiplexer.
////////////////////////////////////////////////////////////////////////////////
#define PFS__LOG_LEVEL 2
#include "pfs/iomux/inet4_addr.hpp"
#include "pfs/iomux/multiplexer.hpp"
#include "pfs/iomux/socket4_addr.hpp"
#include "pfs/iomux/posix/tcp_listener.hpp"
#include "pfs/iomux/posix/tcp_socket.hpp"
#include <pfs/fmt.hpp>
#include <pfs/integer.hpp>
#include <pfs/log.hpp>
#include <pfs/memory.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

static char const * TAG = "ECHO_SERVER";

using tcp_socket = iomux::posix::tcp_socket;
using tcp_listener = iomux::posix::tcp_listener;
using client_multiplexer = iomux::multiplexer<tcp_socket>;
using listener_multiplexer = iomux::multiplexer<tcp_listener>;

static std::atomic_bool g_stop {false};

static void signal_handler (int)
{
    g_stop.store(true);
}

// Owns accepted connections, multiplexer only references them
class connection_registry
{
private:
    std::mutex _mtx;
    std::map<iomux::native_descriptor, std::unique_ptr<tcp_socket>> _sockets;

public:
    tcp_socket & emplace (tcp_socket && sock)
    {
        std::unique_lock<std::mutex> locker{_mtx};
        auto fd = sock.native();
        auto & ptr = _sockets[fd];
        ptr = pfs::make_unique<tcp_socket>(std::move(sock));
        return *ptr;
    }

    void erase (iomux::native_descriptor fd)
    {
        std::unique_lock<std::mutex> locker{_mtx};
        _sockets.erase(fd);
    }

    template <typename F>
    void for_each (F && f)
    {
        std::unique_lock<std::mutex> locker{_mtx};

        for (auto & item: _sockets)
            f(*item.second);
    }
};

static void print_usage (char const * program)
{
    fmt::print(stdout, "Usage\n\t{} [--addr=ip4_addr] [--port=port]\n", program);
    fmt::print(stdout, "\nRun echo server on default address 127.0.0.1:42042\n\t{}\n", program);
}

static void accept_routine (tcp_listener & listener, client_multiplexer & clients
    , connection_registry & registry)
{
    try {
        listener_multiplexer listeners;
        listeners.add(listener);

        while (!g_stop.load()) {
            iomux::error err;
            auto ready = listeners.wait(std::chrono::milliseconds{200}, & err);

            if (err) {
                LOGE(TAG, "wait for listener failure: {}", err.what());
                continue;
            }

            for (auto plistener: ready) {
                for (;;) {
                    auto sock = plistener->accept(& err);

                    if (err) {
                        LOGE(TAG, "accept failure: {}", err.what());
                        break;
                    }

                    if (!sock)
                        break;

                    auto saddr = sock.saddr();
                    auto & conn = registry.emplace(std::move(sock));

                    if (!clients.add(conn, & err)) {
                        LOGE(TAG, "register connection failure: {}: {}", to_string(saddr), err.what());
                        registry.erase(conn.native());
                        err = iomux::error{};
                        continue;
                    }

                    LOGD(TAG, "Client accepted: {} (socket={})", to_string(saddr), conn.native());
                }
            }
        }

        listeners.remove(listener);
    } catch (iomux::error const & ex) {
        LOGE(TAG, "accept routine failure: {}", ex.what());
        g_stop.store(true);
    }
}

static void close_connection (tcp_socket & conn, client_multiplexer & clients
    , connection_registry & registry)
{
    auto fd = conn.native();
    iomux::error err;

    // Remove before close: descriptor number may be reused immediately
    if (!clients.remove(conn, & err))
        LOGE(TAG, "deregister connection failure: socket={}: {}", fd, err.what());

    registry.erase(fd);
}

static void echo (tcp_socket & conn, client_multiplexer & clients, connection_registry & registry)
{
    char buf[4096];
    iomux::error err;

    auto n = conn.recv(buf, sizeof(buf), & err);

    if (err) {
        LOGE(TAG, "read failure: socket={}: {}", conn.native(), err.what());
        close_connection(conn, clients, registry);
        return;
    }

    // Reported ready but nothing to read: peer hung up
    if (n == 0) {
        LOGD(TAG, "Client disconnected: socket={}", conn.native());
        close_connection(conn, clients, registry);
        return;
    }

    auto sent = conn.send(buf, n, & err);

    if (err) {
        LOGE(TAG, "write failure: socket={}: {}", conn.native(), err.what());
        close_connection(conn, clients, registry);
        return;
    }

    if (sent < n)
        LOGW(TAG, "Echo truncated: socket={}, {} of {} bytes", conn.native(), sent, n);
}

static int run_server (iomux::socket4_addr const & saddr)
{
    connection_registry registry;
    client_multiplexer clients;

    clients.on_milestone = [] (std::size_t count) {
        LOGI(TAG, "Total number of connections: {}", count);
    };

    clients.on_stale = [] (iomux::native_descriptor fd) {
        LOGW(TAG, "Readiness reported for unregistered socket: {}", fd);
    };

    tcp_listener listener {saddr};

    if (!listener.listen(128))
        return EXIT_FAILURE;

    LOGI(TAG, "Echo server listening on: {}", to_string(listener.saddr()));

    std::thread acceptor {accept_routine, std::ref(listener), std::ref(clients), std::ref(registry)};

    while (!g_stop.load()) {
        iomux::error err;
        auto ready = clients.wait(std::chrono::milliseconds{200}, & err);

        if (err) {
            LOGE(TAG, "wait for clients failure: {}", err.what());
            continue;
        }

        for (auto conn: ready)
            echo(*conn, clients, registry);
    }

    acceptor.join();

    registry.for_each([& clients] (tcp_socket & conn) {
        iomux::error err;
        clients.remove(conn, & err);
    });

    clients.close();

    LOGI(TAG, "Echo server stopped");

    return EXIT_SUCCESS;
}

int main (int argc, char * argv[])
{
    std::string addr_str {"127.0.0.1"};
    std::string port_str;

    for (int i = 1; i < argc; i++) {
        if (std::string{"-h"} == argv[i] || std::string{"--help"} == argv[i]) {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        } else if (std::strncmp(argv[i], "--addr=", 7) == 0) {
            addr_str = std::string{argv[i] + 7};
        } else if (std::strncmp(argv[i], "--port=", 7) == 0) {
            port_str = std::string{argv[i] + 7};
        } else {
            LOGE(TAG, "Bad option: {}", argv[i]);
            return EXIT_FAILURE;
        }
    }

    auto addr = iomux::inet4_addr::parse(addr_str);

    if (!addr) {
        LOGE(TAG, "Bad address: {}", addr_str);
        return EXIT_FAILURE;
    }

    std::uint16_t port = 42042;

    if (!port_str.empty()) {
        std::error_code ec;
        port = pfs::to_integer(port_str.begin(), port_str.end()
            , std::uint16_t{1024}, std::uint16_t{65535}, ec);

        if (ec) {
            LOGE(TAG, "Bad port: {}", port_str);
            return EXIT_FAILURE;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        return run_server(iomux::socket4_addr{*addr, port});
    } catch (iomux::error const & ex) {
        LOGE(TAG, "ERROR: {}", ex.what());
    }

    return EXIT_FAILURE;
}
