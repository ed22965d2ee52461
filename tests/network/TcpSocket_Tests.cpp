// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Test Suite
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
#include "relay/Defines.h"
#include "common/network/tcp/Socket.h"
#include "common/network/tcp/TcpListener.h"

using namespace network::tcp;

#include <catch2/catch_test_macros.hpp>
#include <cstring>

TEST_CASE("TCP listener binds an ephemeral port", "[network][tcp]") {
    TcpListener listener;
    REQUIRE(listener.open("127.0.0.1", 0U));
    REQUIRE(listener.isOpen());
    REQUIRE(listener.localPort() != 0U);

    // nothing is connecting
    REQUIRE(listener.accept(10U) == nullptr);

    listener.close();
    REQUIRE_FALSE(listener.isOpen());
}

TEST_CASE("TCP socket exchanges data over loopback", "[network][tcp]") {
    TcpListener listener;
    REQUIRE(listener.open("127.0.0.1", 0U));

    Socket client;
    REQUIRE(client.connect("127.0.0.1", listener.localPort(), 1000U));
    REQUIRE(client.isOpen());

    Socket* server = listener.accept(1000U);
    REQUIRE(server != nullptr);
    REQUIRE(server->getRemoteAddress() == "127.0.0.1");

    const char* line = "user N0CALL pass -1\r\n";
    REQUIRE(client.write((const uint8_t*)line, (uint32_t)::strlen(line), 1000U));

    uint8_t buffer[64U];
    ::memset(buffer, 0x00U, sizeof(buffer));
    ssize_t len = server->read(buffer, sizeof(buffer) - 1U, 1000U);
    REQUIRE(len == (ssize_t)::strlen(line));
    REQUIRE(std::string((const char*)buffer) == line);

    // no data pending is a timeout, not an error
    REQUIRE(server->read(buffer, sizeof(buffer), 10U) == 0);

    client.close();
    REQUIRE(server->read(buffer, sizeof(buffer), 1000U) < 0);

    delete server;
}

TEST_CASE("TCP socket connect to a closed port fails", "[network][tcp]") {
    TcpListener probe;
    REQUIRE(probe.open("127.0.0.1", 0U));
    uint16_t port = probe.localPort();
    probe.close();

    Socket socket;
    REQUIRE_FALSE(socket.connect("127.0.0.1", port, 1000U));
    REQUIRE_FALSE(socket.isOpen());
}

TEST_CASE("TCP address lookup", "[network][tcp]") {
    sockaddr_storage addr;
    uint32_t addrLen = 0U;

    REQUIRE(Socket::lookup("127.0.0.1", 14580U, addr, addrLen) == 0);
    REQUIRE(Socket::address(addr) == "127.0.0.1");
    REQUIRE(Socket::port(addr) == 14580U);
}
