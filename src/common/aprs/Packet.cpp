// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
#include "common/aprs/Packet.h"
#include "common/Utils.h"

using namespace aprs;
using namespace aprs::defines;

#include <cctype>

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

const uint64_t FNV_OFFSET_BASIS = 0xCBF29CE484222325ULL;
const uint64_t FNV_PRIME = 0x00000100000001B3ULL;

// ---------------------------------------------------------------------------
//  Global Functions
// ---------------------------------------------------------------------------

/* Helper to check whether a path token is a q-construct. */

static bool isQConstruct(const std::string& token)
{
    return token.length() == 3U && token[0U] == 'q' &&
        ::isupper((unsigned char)token[1U]) && ::isupper((unsigned char)token[2U]);
}

/* Helper to fold a string into a FNV-1a hash. */

static uint64_t fnv1a(uint64_t hash, const std::string& str)
{
    for (char c : str) {
        hash ^= (uint8_t)c;
        hash *= FNV_PRIME;
    }

    return hash;
}

// ---------------------------------------------------------------------------
//  Public Class Members
// ---------------------------------------------------------------------------

/* Initializes a new instance of the PathElement class. */

PathElement::PathElement() :
    m_kind(PathElementKind::HOP),
    m_station(),
    m_used(false),
    m_q(),
    m_serverId()
{
    /* stub */
}

/* Creates a digipeater hop element. */

PathElement PathElement::hop(const StationId& station, bool used)
{
    PathElement elem;
    elem.m_kind = PathElementKind::HOP;
    elem.m_station = station;
    elem.m_used = used;
    return elem;
}

/* Creates a q-construct element. */

PathElement PathElement::qConstruct(const std::string& qConstruct, const std::string& serverId)
{
    PathElement elem;
    elem.m_kind = PathElementKind::Q_CONSTRUCT;
    elem.m_q = qConstruct;
    elem.m_serverId = serverId;
    return elem;
}

/* Encodes the path element. */

std::string PathElement::encode() const
{
    if (m_kind == PathElementKind::Q_CONSTRUCT)
        return m_q + "," + m_serverId;

    std::string text = m_station.encode();
    if (m_used)
        text += "*";

    return text;
}

/* Flag indicating whether this element is a server-to-server relay marker. */

bool PathElement::isRelayMarker() const
{
    return m_kind == PathElementKind::Q_CONSTRUCT && m_q == RELAY_Q_CONSTRUCT;
}

/* Equals operator. */

bool PathElement::operator==(const PathElement& data) const
{
    if (m_kind != data.m_kind)
        return false;

    if (m_kind == PathElementKind::Q_CONSTRUCT)
        return m_q == data.m_q && m_serverId == data.m_serverId;

    return m_station == data.m_station && m_used == data.m_used;
}

/* Initializes a new instance of the Packet class. */

Packet::Packet() :
    m_source(),
    m_destination(),
    m_payload(),
    m_rxTime(0U),
    m_path()
{
    /* stub */
}

/* Decode a packet from a received line. */

PacketError::ENUM Packet::decode(const std::string& line, uint32_t maxPath)
{
    std::string text = line;
    while (!text.empty() && (text.back() == '\r' || text.back() == '\n'))
        text.pop_back();

    if (text.empty() || text.length() > MAX_LINE_LEN)
        return PacketError::MALFORMED_PACKET;

    // embedded line terminators or NULs would break framing once re-encoded
    if (text.find_first_of(std::string("\r\n\0", 3U)) != std::string::npos)
        return PacketError::MALFORMED_PACKET;

    size_t colon = text.find(':');
    size_t gt = text.find('>');
    if (colon == std::string::npos || gt == std::string::npos || gt == 0U || gt > colon)
        return PacketError::MALFORMED_PACKET;

    std::string payload = text.substr(colon + 1U);
    if (payload.empty())
        return PacketError::MALFORMED_PACKET;

    std::vector<std::string> fields = Utils::split(text.substr(gt + 1U, colon - gt - 1U), ',');
    for (const std::string& field : fields) {
        if (field.empty())
            return PacketError::MALFORMED_PACKET;
    }

    StationId source;
    if (!StationId::decode(text.substr(0U, gt), source))
        return PacketError::INVALID_CALLSIGN;

    StationId destination;
    if (!StationId::decode(fields[0U], destination))
        return PacketError::INVALID_CALLSIGN;

    std::vector<PathElement> path;
    for (size_t i = 1U; i < fields.size(); i++) {
        const std::string& token = fields[i];
        if (isQConstruct(token)) {
            // a q-construct is always followed by the identity of the server that added it
            if (i + 1U >= fields.size())
                return PacketError::MALFORMED_PACKET;

            const std::string& serverId = fields[++i];
            if (!isValidServerId(serverId))
                return PacketError::INVALID_CALLSIGN;

            path.push_back(PathElement::qConstruct(token, Utils::toUpper(serverId)));
            continue;
        }

        std::string hopText = token;
        bool used = false;
        if (hopText.back() == '*') {
            used = true;
            hopText.pop_back();
        }

        StationId hop;
        if (!StationId::decode(hopText, hop))
            return PacketError::INVALID_CALLSIGN;

        path.push_back(PathElement::hop(hop, used));
    }

    if (path.size() > maxPath)
        return PacketError::PATH_TOO_LONG;

    m_source = source;
    m_destination = destination;
    m_path = path;
    m_payload = payload;
    return PacketError::NONE;
}

/* Encode a packet. */

std::string Packet::encode() const
{
    std::string text = m_source.encode() + ">" + m_destination.encode();
    for (const PathElement& elem : m_path) {
        text += ",";
        text += elem.encode();
    }

    text += ":";
    text += m_payload;
    return text;
}

/* Computes the packet fingerprint over source, destination and payload. */

uint64_t Packet::fingerprint() const
{
    uint64_t hash = FNV_OFFSET_BASIS;
    hash = fnv1a(hash, m_source.encode());
    hash = fnv1a(hash, ">");
    hash = fnv1a(hash, m_destination.encode());
    hash = fnv1a(hash, ":");
    hash = fnv1a(hash, m_payload);
    return hash;
}

/* Checks whether the path carries the relay marker of the given server. */

bool Packet::hasRelayMarker(const std::string& serverId) const
{
    std::string id = Utils::toUpper(serverId);
    for (const PathElement& elem : m_path) {
        if (elem.isRelayMarker() && elem.serverId() == id)
            return true;
    }

    return false;
}

/* Appends the relay marker of the given server to the path. */

bool Packet::addRelayMarker(const std::string& serverId, uint32_t maxPath)
{
    if (hasRelayMarker(serverId))
        return true;
    if (m_path.size() >= maxPath)
        return false;

    m_path.push_back(PathElement::qConstruct(RELAY_Q_CONSTRUCT, Utils::toUpper(serverId)));
    return true;
}

/* Returns the addressee of an APRS message payload. */

std::string Packet::messageAddressee() const
{
    // message payload: ':' ADDRESSEE(9, space padded) ':' TEXT
    if (m_payload.length() < MESSAGE_ADDRESSEE_LEN + 2U || m_payload[0U] != ':' ||
        m_payload[MESSAGE_ADDRESSEE_LEN + 1U] != ':')
        return std::string();

    return Utils::toUpper(Utils::trim(m_payload.substr(1U, MESSAGE_ADDRESSEE_LEN)));
}

/* Equals operator. */

bool Packet::operator==(const Packet& data) const
{
    return m_source == data.m_source && m_destination == data.m_destination &&
        m_path == data.m_path && m_payload == data.m_payload;
}
