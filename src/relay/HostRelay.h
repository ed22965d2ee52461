// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Relay Daemon
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
/**
 * @file HostRelay.h
 * @ingroup relay
 * @file HostRelay.cpp
 * @ingroup relay
 */
#if !defined(__HOST_RELAY_H__)
#define __HOST_RELAY_H__

#include "Defines.h"
#include "common/network/tcp/Socket.h"
#include "network/ClientSession.h"
#include "network/ConnectionListener.h"
#include "network/PeerManager.h"
#include "network/PeerSession.h"
#include "network/Router.h"

#include "yaml/Yaml.h"

#include <mutex>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
//  Class Declaration
// ---------------------------------------------------------------------------

/**
 * @brief This class implements the core relay service logic.
 * @ingroup relay
 */
class RELAY_SW_API HostRelay {
public:
    /**
     * @brief Initializes a new instance of the HostRelay class.
     * @param confFile Full-path to the configuration file.
     */
    HostRelay(const std::string& confFile);
    /**
     * @brief Finalizes a instance of the HostRelay class.
     */
    ~HostRelay();

    /**
     * @brief Executes the main relay processing loop.
     * @returns int Zero if successful, otherwise error occurred.
     */
    int run();

private:
    std::string m_confFile;
    yaml::Node m_conf;

    std::string m_serverId;
    std::string m_address;
    uint16_t m_userPort;
    uint16_t m_serverPort;
    uint16_t m_s2sPort;
    uint32_t m_statusInterval;
    uint32_t m_maxQueueLines;

    network::ClientSessionConfig m_clientConfig;
    network::RouterConfig m_routerConfig;
    network::PeerManagerConfig m_peerConfig;
    std::vector<network::PeerDescriptor> m_descriptors;

    network::Router* m_router;
    network::PeerManager* m_peerManager;

    network::ConnectionListener* m_userListener;
    network::ConnectionListener* m_serverListener;
    network::ConnectionListener* m_s2sListener;

    std::vector<network::ClientSession*> m_clients;
    std::mutex m_clientsMutex;
    uint32_t m_nextClientId;

    /**
     * @brief Reads basic configuration parameters from the YAML configuration file.
     * @returns bool True, if the configuration was read, otherwise false.
     */
    bool readParams();
    /**
     * @brief Reads the S2S peer and uplink descriptors from the YAML configuration file.
     * @returns bool True, if the descriptors were read, otherwise false.
     */
    bool readPeers();
    /**
     * @brief Opens the client and S2S listeners.
     * @returns bool True, if every configured port was bound, otherwise false.
     */
    bool createListeners();

    /**
     * @brief Creates a client session for an accepted connection.
     * @param socket Accepted socket.
     */
    void acceptClient(network::tcp::Socket* socket);
    /**
     * @brief Joins and deletes finished client sessions.
     */
    void reapClients();
    /**
     * @brief Stops every client session and waits for their threads.
     */
    void closeClients();
    /**
     * @brief Logs the router and peer status.
     */
    void logStatus();
};

#endif // __HOST_RELAY_H__
