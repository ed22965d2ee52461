// SPDX-License-Identifier: GPL-2.0-only
/*
 * APRS-IS Relay - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 APRS-IS Relay Authors
 *
 */
/**
 * @file Packet.h
 * @ingroup aprs
 * @file Packet.cpp
 * @ingroup aprs
 */
#if !defined(__APRS__PACKET_H__)
#define  __APRS__PACKET_H__

#include "common/Defines.h"
#include "common/aprs/AprsDefines.h"
#include "common/aprs/StationId.h"

#include <string>
#include <vector>

namespace aprs
{
    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Represents a single element of a packet path.
     * @ingroup aprs
     *
     * A path element is either a digipeater hop (station identifier with an optional
     * "used" asterisk) or a q-construct paired with the server identity that follows
     * it on the wire (e.g. "qAS,T2TEST").
     */
    class RELAY_SW_API PathElement {
    public:
        /**
         * @brief Initializes a new instance of the PathElement class.
         */
        PathElement();

        /**
         * @brief Creates a digipeater hop element.
         * @param station Station identifier.
         * @param used Flag indicating the hop has been used ('*').
         * @returns PathElement Path element.
         */
        static PathElement hop(const StationId& station, bool used = false);
        /**
         * @brief Creates a q-construct element.
         * @param qConstruct q-construct (e.g. "qAS").
         * @param serverId Server identity (uppercase).
         * @returns PathElement Path element.
         */
        static PathElement qConstruct(const std::string& qConstruct, const std::string& serverId);

        /**
         * @brief Encodes the path element.
         * @returns std::string Element text (q-constructs include the comma separated identity).
         */
        std::string encode() const;

        /**
         * @brief Flag indicating whether this element is a server-to-server relay marker.
         * @returns bool True, if this element is a relay marker, otherwise false.
         */
        bool isRelayMarker() const;

        /**
         * @brief Equals operator.
         * @param data Instance of PathElement to compare.
         */
        bool operator==(const PathElement& data) const;
        /**
         * @brief Not-equals operator.
         * @param data Instance of PathElement to compare.
         */
        bool operator!=(const PathElement& data) const { return !(*this == data); }

    public:
        /**
         * @brief Path Element Kind.
         */
        DECLARE_RO_PROPERTY_PLAIN(defines::PathElementKind::ENUM, kind);
        /**
         * @brief Hop Station (hop elements only).
         */
        DECLARE_RO_PROPERTY_PLAIN(StationId, station);
        /**
         * @brief Flag indicating the hop was used (hop elements only).
         */
        DECLARE_RO_PROPERTY_PLAIN(bool, used);
        /**
         * @brief q-Construct (q-construct elements only).
         */
        DECLARE_RO_PROPERTY_PLAIN(std::string, q);
        /**
         * @brief Server Identity (q-construct elements only).
         */
        DECLARE_RO_PROPERTY_PLAIN(std::string, serverId);
    };

    // ---------------------------------------------------------------------------
    //  Class Declaration
    // ---------------------------------------------------------------------------

    /**
     * @brief Represents an APRS-IS TNC2 text packet.
     * @ingroup aprs
     *
     * Wire format: SOURCE '>' DEST (',' PATH)* ':' PAYLOAD. The payload is opaque.
     */
    class RELAY_SW_API Packet {
    public:
        /**
         * @brief Initializes a new instance of the Packet class.
         */
        Packet();

        /**
         * @brief Decode a packet from a received line.
         * @param line Line text (trailing CR/LF is ignored).
         * @param maxPath Maximum number of path elements.
         * @returns PacketError::ENUM Decode result; NONE on success.
         */
        defines::PacketError::ENUM decode(const std::string& line, uint32_t maxPath = defines::DEFAULT_MAX_PATH);
        /**
         * @brief Encode a packet.
         * @returns std::string Encoded line (without line terminator).
         */
        std::string encode() const;

        /**
         * @brief Computes the packet fingerprint over source, destination and payload.
         * @returns uint64_t Fingerprint.
         *
         * The path is excluded, the same packet received over different paths has the
         * same fingerprint.
         */
        uint64_t fingerprint() const;

        /**
         * @brief Checks whether the path carries the relay marker of the given server.
         * @param serverId Server identity.
         * @returns bool True, if the server has already relayed this packet, otherwise false.
         */
        bool hasRelayMarker(const std::string& serverId) const;
        /**
         * @brief Appends the relay marker of the given server to the path.
         * @param serverId Server identity.
         * @param maxPath Maximum number of path elements.
         * @returns bool True, if the packet carries the marker, false if the path is full.
         */
        bool addRelayMarker(const std::string& serverId, uint32_t maxPath);

        /**
         * @brief Returns the addressee of an APRS message payload.
         * @returns std::string Uppercased addressee, or an empty string if the payload is not a message.
         */
        std::string messageAddressee() const;

        /**
         * @brief Gets the packet path.
         * @returns const std::vector<PathElement>& Path elements.
         */
        const std::vector<PathElement>& path() const { return m_path; }
        /**
         * @brief Sets the packet path.
         * @param path Path elements.
         */
        void path(const std::vector<PathElement>& path) { m_path = path; }

        /**
         * @brief Equals operator; compares the wire fields only.
         * @param data Instance of Packet to compare.
         */
        bool operator==(const Packet& data) const;
        /**
         * @brief Not-equals operator.
         * @param data Instance of Packet to compare.
         */
        bool operator!=(const Packet& data) const { return !(*this == data); }

    public:
        /**
         * @brief Source Station.
         */
        DECLARE_PROPERTY_PLAIN(StationId, source);
        /**
         * @brief Destination.
         */
        DECLARE_PROPERTY_PLAIN(StationId, destination);
        /**
         * @brief Payload.
         */
        DECLARE_PROPERTY_PLAIN(std::string, payload);
        /**
         * @brief Receipt time (milliseconds since epoch); assigned locally, not part of the wire format.
         */
        DECLARE_PROPERTY_PLAIN(uint64_t, rxTime);

    private:
        std::vector<PathElement> m_path;
    };
} // namespace aprs

#endif // __APRS__PACKET_H__
