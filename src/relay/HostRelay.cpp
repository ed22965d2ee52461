// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Relay Daemon
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
#include "Defines.h"
#include "common/aprs/StationId.h"
#include "common/Log.h"
#include "common/StopWatch.h"
#include "common/Thread.h"
#include "common/Timer.h"
#include "common/Utils.h"
#include "ActivityLog.h"
#include "HostRelay.h"
#include "RelayMain.h"

using namespace network;
using namespace relay;

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <algorithm>

#include <sys/utsname.h>
#include <unistd.h>

// ---------------------------------------------------------------------------
//  Static Class Members
// ---------------------------------------------------------------------------

static bool s_daemonized = false;

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the HostRelay class. */

HostRelay::HostRelay(const std::string& confFile) :
    m_confFile(confFile),
    m_conf(),
    m_serverId(),
    m_address(),
    m_userPort(DEFAULT_USER_PORT),
    m_serverPort(0U),
    m_s2sPort(DEFAULT_S2S_PORT),
    m_statusInterval(DEFAULT_STATUS_INTERVAL),
    m_maxQueueLines(DEFAULT_MAX_QUEUE_LINES),
    m_clientConfig(),
    m_routerConfig(),
    m_peerConfig(),
    m_descriptors(),
    m_router(nullptr),
    m_peerManager(nullptr),
    m_userListener(nullptr),
    m_serverListener(nullptr),
    m_s2sListener(nullptr),
    m_clients(),
    m_clientsMutex(),
    m_nextClientId(1U)
{
    /* stub */
}

/* Finalizes a instance of the HostRelay class. */

HostRelay::~HostRelay() = default;

/* Executes the main relay processing loop. */

int HostRelay::run()
{
    bool ret = false;
    try {
        ret = yaml::Parse(m_conf, m_confFile.c_str());
        if (!ret) {
            ::fatal("cannot read the configuration file, %s\n", m_confFile.c_str());
        }
    }
    catch (yaml::OperationException const& e) {
        ::fatal("cannot read the configuration file - %s (%s)", m_confFile.c_str(), e.message());
    }

    bool m_daemon = m_conf["daemon"].as<bool>(false);
    if (m_daemon && g_foreground)
        m_daemon = false;

    // initialize system logging
    yaml::Node logConf = m_conf["log"];
    bool useSyslog = logConf["useSyslog"].as<bool>(false);
    if (g_foreground)
        useSyslog = false;
    ret = ::LogInitialise(logConf["filePath"].as<std::string>(), logConf["fileRoot"].as<std::string>(),
        logConf["fileLevel"].as<uint32_t>(0U), logConf["displayLevel"].as<uint32_t>(0U), false, useSyslog);
    if (!ret) {
        ::fatal("unable to open the log file\n");
    }

    ret = ::ActivityLogInitialise(logConf["activityFilePath"].as<std::string>(), logConf["fileRoot"].as<std::string>());
    if (!ret) {
        ::fatal("unable to open the activity log file\n");
    }

    // handle POSIX process forking
    if (m_daemon && !s_daemonized) {
        // create new process
        pid_t pid = ::fork();
        if (pid == -1) {
            ::fprintf(stderr, "%s: Couldn't fork() , exiting\n", g_progExe.c_str());
            ::LogFinalise();
            return EXIT_FAILURE;
        }
        else if (pid != 0) {
            ::LogFinalise();
            exit(EXIT_SUCCESS);
        }

        // create new session and process group
        if (::setsid() == -1) {
            ::fprintf(stderr, "%s: Couldn't setsid(), exiting\n", g_progExe.c_str());
            ::LogFinalise();
            return EXIT_FAILURE;
        }

        // set the working directory to the root directory
        if (::chdir("/") == -1) {
            ::fprintf(stderr, "%s: Couldn't cd /, exiting\n", g_progExe.c_str());
            ::LogFinalise();
            return EXIT_FAILURE;
        }

        ::close(STDIN_FILENO);
        ::close(STDOUT_FILENO);
        ::close(STDERR_FILENO);

        s_daemonized = true;
    }

    ::LogInfo(__BANNER__ "\r\n" __PROG_NAME__ " " __VER__ " (built " __BUILD__ ")\r\n" \
        "Copyright (c) 2026 APRS-IS Relay Authors.\r\n" \
        ">> APRS-IS Relay\r\n");

    // read base parameters from configuration
    ret = readParams();
    if (!ret)
        return EXIT_FAILURE;

    ret = readPeers();
    if (!ret)
        return EXIT_FAILURE;

    m_router = new Router(m_serverId, m_routerConfig);
    m_peerManager = new PeerManager(m_router, m_peerConfig, m_descriptors);

    ret = createListeners();
    if (!ret) {
        delete m_userListener;
        delete m_serverListener;
        delete m_s2sListener;
        closeClients();

        delete m_peerManager;
        m_peerManager = nullptr;
        delete m_router;
        m_router = nullptr;
        return EXIT_FAILURE;
    }

    struct utsname utsinfo;
    ::memset(&utsinfo, 0, sizeof(utsinfo));
    ::uname(&utsinfo);

    ::LogInfoEx(LOG_HOST, "[ OK ] %s is up and running on %s %s %s", m_serverId.c_str(), utsinfo.sysname, utsinfo.release, utsinfo.machine);
    ActivityLog("relay %s started", m_serverId.c_str());

    Timer statusTimer(1000U, m_statusInterval);
    statusTimer.start();

    StopWatch stopWatch;
    stopWatch.start();

    /*
    ** Main execution loop
    */
    while (!g_killed) {
        uint32_t ms = stopWatch.elapsed();
        stopWatch.start();

        // ------------------------------------------------------
        //  -- Network Clocking                               --
        // ------------------------------------------------------

        m_router->clock(ms);
        m_peerManager->clock(ms);

        reapClients();

        statusTimer.clock(ms);
        if (statusTimer.isRunning() && statusTimer.hasExpired()) {
            logStatus();
            statusTimer.start();
        }

        Thread::sleep(10U);
    }

    // shutdown listeners
    if (m_userListener != nullptr) {
        m_userListener->close();
        delete m_userListener;
    }

    if (m_serverListener != nullptr) {
        m_serverListener->close();
        delete m_serverListener;
    }

    if (m_s2sListener != nullptr) {
        m_s2sListener->close();
        delete m_s2sListener;
    }

    closeClients();

    m_peerManager->close();
    logStatus();

    delete m_peerManager;
    m_peerManager = nullptr;
    delete m_router;
    m_router = nullptr;

    ActivityLog("relay %s stopped", m_serverId.c_str());
    return EXIT_SUCCESS;
}

// ---------------------------------------------------------------------------
//  Private Class Members
// ---------------------------------------------------------------------------

/* Reads basic configuration parameters from the YAML configuration file. */

bool HostRelay::readParams()
{
    yaml::Node systemConf = m_conf["system"];
    m_serverId = Utils::toUpper(systemConf["serverId"].as<std::string>());
    if (!aprs::isValidServerId(m_serverId)) {
        ::LogError(LOG_HOST, "Server identity \"%s\" is invalid, it must be 1-9 alphanumerics or '-'.", m_serverId.c_str());
        return false;
    }

    yaml::Node networkConf = m_conf["network"];
    m_address = networkConf["address"].as<std::string>("0.0.0.0");
    m_userPort = (uint16_t)networkConf["userPort"].as<uint32_t>(DEFAULT_USER_PORT);
    m_serverPort = (uint16_t)networkConf["serverPort"].as<uint32_t>(0U);
    m_s2sPort = (uint16_t)networkConf["s2sPort"].as<uint32_t>(DEFAULT_S2S_PORT);
    m_maxQueueLines = networkConf["maxQueueLines"].as<uint32_t>(DEFAULT_MAX_QUEUE_LINES);
    if (m_maxQueueLines == 0U)
        m_maxQueueLines = DEFAULT_MAX_QUEUE_LINES;

    m_clientConfig.serverId = m_serverId;
    m_clientConfig.loginTimeout = networkConf["loginTimeout"].as<uint32_t>(DEFAULT_LOGIN_TIMEOUT);
    m_clientConfig.heartbeat = networkConf["clientHeartbeat"].as<uint32_t>(DEFAULT_CLIENT_HEARTBEAT);
    m_clientConfig.idleTimeout = networkConf["clientIdleTimeout"].as<uint32_t>(DEFAULT_CLIENT_IDLE_TIMEOUT);
    m_clientConfig.maxBadPackets = networkConf["maxBadPackets"].as<uint32_t>(DEFAULT_MAX_BAD_PACKETS);
    if (m_clientConfig.loginTimeout == 0U)
        m_clientConfig.loginTimeout = DEFAULT_LOGIN_TIMEOUT;
    if (m_clientConfig.maxBadPackets == 0U)
        m_clientConfig.maxBadPackets = DEFAULT_MAX_BAD_PACKETS;

    yaml::Node& allowList = networkConf["allowCallsigns"];
    for (size_t i = 0; i < allowList.size(); i++) {
        m_clientConfig.allowCallsigns.push_back(Utils::toUpper(allowList[i].as<std::string>()));
    }

    yaml::Node& denyList = networkConf["denyCallsigns"];
    for (size_t i = 0; i < denyList.size(); i++) {
        m_clientConfig.denyCallsigns.push_back(Utils::toUpper(denyList[i].as<std::string>()));
    }

    yaml::Node routingConf = m_conf["routing"];
    m_routerConfig.maxPath = routingConf["maxPathLength"].as<uint32_t>(aprs::defines::DEFAULT_MAX_PATH);
    m_routerConfig.dedupWindow = routingConf["dedupWindow"].as<uint32_t>(DEFAULT_DEDUP_WINDOW);
    m_routerConfig.dedupMaxEntries = routingConf["dedupMaxEntries"].as<uint32_t>(DEFAULT_DEDUP_MAX_ENTRIES);
    m_routerConfig.allowReadOnlyLocal = networkConf["allowReadOnlyLocal"].as<bool>(false);
    m_statusInterval = routingConf["statusInterval"].as<uint32_t>(DEFAULT_STATUS_INTERVAL);

    if (m_routerConfig.maxPath == 0U) {
        m_routerConfig.maxPath = aprs::defines::DEFAULT_MAX_PATH;
    }

    if (m_routerConfig.dedupWindow == 0U) {
        ::LogWarning(LOG_HOST, "Dedup window cannot be 0, using %us.", DEFAULT_DEDUP_WINDOW);
        m_routerConfig.dedupWindow = DEFAULT_DEDUP_WINDOW;
    }

    m_clientConfig.maxPath = m_routerConfig.maxPath;

    yaml::Node s2sConf = m_conf["s2s"];
    m_peerConfig.session.serverId = m_serverId;
    m_peerConfig.session.s2sPort = m_s2sPort;
    m_peerConfig.session.heartbeat = s2sConf["heartbeatInterval"].as<uint32_t>(DEFAULT_PEER_HEARTBEAT);
    m_peerConfig.session.idleTimeout = s2sConf["idleTimeout"].as<uint32_t>(DEFAULT_PEER_IDLE_TIMEOUT);
    m_peerConfig.session.handshakeTimeout = s2sConf["handshakeTimeout"].as<uint32_t>(DEFAULT_HANDSHAKE_TIMEOUT);
    m_peerConfig.session.connectTimeout = s2sConf["connectTimeout"].as<uint32_t>(DEFAULT_CONNECT_TIMEOUT);
    m_peerConfig.session.maxPath = m_routerConfig.maxPath;
    m_peerConfig.backoffMin = s2sConf["backoffMin"].as<uint32_t>(DEFAULT_BACKOFF_MIN);
    m_peerConfig.backoffMax = s2sConf["backoffMax"].as<uint32_t>(DEFAULT_BACKOFF_MAX);
    m_peerConfig.backoffStable = s2sConf["backoffStable"].as<uint32_t>(DEFAULT_BACKOFF_STABLE);
    m_peerConfig.maxQueueLines = m_maxQueueLines;

    if (m_peerConfig.session.handshakeTimeout == 0U)
        m_peerConfig.session.handshakeTimeout = DEFAULT_HANDSHAKE_TIMEOUT;
    if (m_peerConfig.session.connectTimeout == 0U)
        m_peerConfig.session.connectTimeout = DEFAULT_CONNECT_TIMEOUT;
    if (m_peerConfig.backoffMin == 0U)
        m_peerConfig.backoffMin = DEFAULT_BACKOFF_MIN;
    if (m_peerConfig.backoffMax < m_peerConfig.backoffMin)
        m_peerConfig.backoffMax = m_peerConfig.backoffMin;

    LogInfo("General Parameters");
    LogInfo("    Server Identity: %s", m_serverId.c_str());

    LogInfo("Network Parameters");
    LogInfo("    Address: %s", m_address.c_str());
    LogInfo("    Client Port: %u", m_userPort);
    if (m_serverPort > 0U)
        LogInfo("    Secondary Client Port: %u", m_serverPort);
    LogInfo("    S2S Port: %u", m_s2sPort);
    LogInfo("    Login Timeout: %us", m_clientConfig.loginTimeout);
    LogInfo("    Client Heartbeat: %us", m_clientConfig.heartbeat);
    LogInfo("    Client Idle Timeout: %us", m_clientConfig.idleTimeout);
    LogInfo("    Max Queue Lines: %u", m_maxQueueLines);
    LogInfo("    Max Bad Packets: %u", m_clientConfig.maxBadPackets);
    LogInfo("    Allow Receive-Only Local Traffic: %s", m_routerConfig.allowReadOnlyLocal ? "yes" : "no");
    LogInfo("    Allowed Callsigns: %u", (uint32_t)m_clientConfig.allowCallsigns.size());
    LogInfo("    Denied Callsigns: %u", (uint32_t)m_clientConfig.denyCallsigns.size());

    LogInfo("Routing Parameters");
    LogInfo("    Max Path Length: %u", m_routerConfig.maxPath);
    LogInfo("    Dedup Window: %us", m_routerConfig.dedupWindow);
    LogInfo("    Dedup Max Entries: %u", m_routerConfig.dedupMaxEntries);
    LogInfo("    Status Interval: %us", m_statusInterval);

    LogInfo("S2S Parameters");
    LogInfo("    Heartbeat Interval: %us", m_peerConfig.session.heartbeat);
    LogInfo("    Idle Timeout: %us", m_peerConfig.session.idleTimeout);
    LogInfo("    Handshake Timeout: %us", m_peerConfig.session.handshakeTimeout);
    LogInfo("    Connect Timeout: %us", m_peerConfig.session.connectTimeout);
    LogInfo("    Reconnect Backoff: %us - %us (stable after %us)", m_peerConfig.backoffMin, m_peerConfig.backoffMax, m_peerConfig.backoffStable);

    return true;
}

/* Reads the S2S peer and uplink descriptors from the YAML configuration file. */

bool HostRelay::readPeers()
{
    yaml::Node s2sConf = m_conf["s2s"];
    yaml::Node& peerList = s2sConf["peers"];
    for (size_t i = 0; i < peerList.size(); i++) {
        yaml::Node& peerConf = peerList[i];

        PeerDescriptor desc;
        desc.enabled = peerConf["enabled"].as<bool>(true);
        desc.host = peerConf["host"].as<std::string>();
        desc.port = (uint16_t)peerConf["port"].as<uint32_t>(DEFAULT_S2S_PORT);
        desc.passcode = peerConf["passcode"].as<int32_t>(0);
        desc.peerName = Utils::toUpper(peerConf["peerName"].as<std::string>());
        desc.receiveOnly = peerConf["receiveOnly"].as<bool>(false);
        desc.connect = peerConf["connect"].as<bool>(true);
        desc.uplink = false;

        if (desc.host.empty() && desc.peerName.empty()) {
            ::LogWarning(LOG_HOST, "S2S peer %u has neither host nor peerName, ignoring.", (uint32_t)i);
            continue;
        }

        if (desc.connect && desc.host.empty()) {
            ::LogWarning(LOG_HOST, "S2S peer %s has no host and cannot be dialed, accepting inbound only.", desc.peerName.c_str());
            desc.connect = false;
        }

        if (!desc.peerName.empty() && !aprs::isValidServerId(desc.peerName)) {
            ::LogError(LOG_HOST, "S2S peer name \"%s\" is invalid.", desc.peerName.c_str());
            return false;
        }

        ::LogInfoEx(LOG_HOST, "S2S Peer %s Host %s Port %u Enabled %u Connect %u Receive-Only %u", desc.peerName.empty() ? "(unnamed)" : desc.peerName.c_str(),
            desc.host.empty() ? "(any)" : desc.host.c_str(), desc.port, desc.enabled, desc.connect, desc.receiveOnly);
        m_descriptors.push_back(desc);
    }

    yaml::Node uplinkConf = m_conf["uplink"];
    if (uplinkConf["enabled"].as<bool>(false)) {
        PeerDescriptor desc;
        desc.enabled = true;
        desc.uplink = true;
        desc.connect = true;
        desc.host = uplinkConf["host"].as<std::string>();
        desc.port = (uint16_t)uplinkConf["port"].as<uint32_t>(DEFAULT_USER_PORT);
        desc.peerName = Utils::toUpper(uplinkConf["callsign"].as<std::string>(m_serverId));
        desc.passcode = uplinkConf["passcode"].as<int32_t>(-1);

        if (desc.host.empty()) {
            ::LogError(LOG_HOST, "Uplink is enabled but no host is configured.");
            return false;
        }

        aprs::StationId callsign;
        if (!aprs::StationId::decode(desc.peerName, callsign)) {
            ::LogError(LOG_HOST, "Uplink callsign \"%s\" is invalid.", desc.peerName.c_str());
            return false;
        }

        LogInfo("Uplink Parameters");
        LogInfo("    Host: %s", desc.host.c_str());
        LogInfo("    Port: %u", desc.port);
        LogInfo("    Callsign: %s", desc.peerName.c_str());
        m_descriptors.push_back(desc);
    }

    return true;
}

/* Opens the client and S2S listeners. */

bool HostRelay::createListeners()
{
    m_userListener = new ConnectionListener("client", [=](tcp::Socket* socket) { acceptClient(socket); });
    if (!m_userListener->open(m_address, m_userPort))
        return false;

    if (m_serverPort > 0U) {
        m_serverListener = new ConnectionListener("secondary client", [=](tcp::Socket* socket) { acceptClient(socket); });
        if (!m_serverListener->open(m_address, m_serverPort))
            return false;
    }

    PeerManager* manager = m_peerManager;
    m_s2sListener = new ConnectionListener("S2S", [=](tcp::Socket* socket) { manager->acceptInbound(socket); });
    if (!m_s2sListener->open(m_address, m_s2sPort))
        return false;

    if (!m_userListener->run())
        return false;
    m_userListener->setName("relay:client");

    if (m_serverListener != nullptr) {
        if (!m_serverListener->run())
            return false;
        m_serverListener->setName("relay:client2");
    }

    if (!m_s2sListener->run())
        return false;
    m_s2sListener->setName("relay:s2s");

    return true;
}

/* Creates a client session for an accepted connection. */

void HostRelay::acceptClient(tcp::Socket* socket)
{
    std::lock_guard<std::mutex> lock(m_clientsMutex);

    ClientSession* session = new ClientSession(m_nextClientId++, socket, m_router, m_clientConfig, m_maxQueueLines);
    if (!session->run()) {
        LogError(LOG_CLIENT, "failed to start session thread for %s", session->address().c_str());
        delete session;
        return;
    }

    session->setName("relay:client");
    m_clients.push_back(session);
}

/* Joins and deletes finished client sessions. */

void HostRelay::reapClients()
{
    std::vector<ClientSession*> finished;
    {
        std::lock_guard<std::mutex> lock(m_clientsMutex);
        auto it = std::remove_if(m_clients.begin(), m_clients.end(), [&](ClientSession* session) {
            if (!session->isFinished())
                return false;

            finished.push_back(session);
            return true;
        });
        m_clients.erase(it, m_clients.end());
    }

    for (ClientSession* session : finished) {
        session->wait();
        delete session;
    }
}

/* Stops every client session and waits for their threads. */

void HostRelay::closeClients()
{
    std::vector<ClientSession*> sessions;
    {
        std::lock_guard<std::mutex> lock(m_clientsMutex);
        sessions.swap(m_clients);
    }

    for (ClientSession* session : sessions)
        session->stop();

    for (ClientSession* session : sessions) {
        session->wait();
        delete session;
    }
}

/* Logs the router and peer status. */

void HostRelay::logStatus()
{
    RouterStatus status = m_router->getStatus();
    LogInfoEx(LOG_HOST, "status, clients = %u, peers = %u, uplink = %s, dedup = %u, rx = %llu, tx = %llu, duplicates = %llu, loops = %llu, read-only drops = %llu, %u pkt/s",
        status.clients, status.peers, status.uplinkConnected ? "up" : "down", status.dedupSize,
        (unsigned long long)status.packetsRx, (unsigned long long)status.packetsTx, (unsigned long long)status.duplicates,
        (unsigned long long)status.loops, (unsigned long long)status.readOnlyDrops, status.packetsPerSec);

    if (m_peerManager == nullptr)
        return;

    std::vector<PeerStatus> peers = m_peerManager->getPeerStatus();
    for (const PeerStatus& peer : peers) {
        LogInfoEx(LOG_HOST, "    %s %s (%s:%u), %s, connects = %u, failures = %u, rx = %u, tx = %u, last error = %s",
            peer.uplink ? "uplink" : "peer", peer.peerName.c_str(), peer.host.c_str(), peer.port, peerStateToString(peer.state),
            peer.connects, peer.failures, peer.packetsRx, peer.packetsTx, sessionErrorToString(peer.lastError));
    }
}
