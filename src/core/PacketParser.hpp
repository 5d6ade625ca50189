/*
 * Copyright 2019 Applied Research Center for Computer Networks
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include "Common.hpp"
#include "types/ethaddr.hh"
#include "types/IPv4Addr.hh"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>

namespace arpguard {

namespace arp_op {
constexpr uint16_t request = 1;
constexpr uint16_t reply   = 2;
}

struct ArpHeader {
    uint16_t opcode;
    ethaddr  sha;
    IPv4Addr spa;
    ethaddr  tha;
    IPv4Addr tpa;
};

/** Address handed out by a DHCPACK: `ip` now belongs to `mac`. */
struct DhcpLease {
    IPv4Addr ip;
    ethaddr  mac;
};

/**
 * Header fields of a packet sent to the controller.
 *
 * Optional members are present only when the corresponding layer exists.
 */
struct PacketInfo {
    ethaddr  eth_src;
    ethaddr  eth_dst;
    uint16_t eth_type {0};
    std::optional<uint16_t> vlan_id;

    std::optional<ArpHeader> arp;

    std::optional<IPv4Addr> ip_src;
    std::optional<IPv4Addr> ip_dst;
    std::optional<uint8_t>  ip_proto;

    std::optional<uint16_t> tp_src;
    std::optional<uint16_t> tp_dst;

    // Server to client DHCPACK with a non-zero yiaddr
    std::optional<DhcpLease> dhcp_ack;

    bool is_arp() const { return eth_type == ethertype::arp; }
};

std::ostream& operator<<(std::ostream& out, const PacketInfo& pkt);

/**
 * Decodes an Ethernet frame.
 *
 * @throws malformed_packet if a recognized header is truncated or inconsistent.
 */
PacketInfo parse_packet(const uint8_t* data, size_t len);

} // namespace arpguard
