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

/** @file FlowRule.hpp
  * @brief Protocol independent flow rules and packet-outs emitted by the core.
  */
#pragma once

#include "PacketParser.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <vector>

namespace arpguard {

/** Reserved port numbers, OpenFlow 1.3 numbering. */
namespace port {
constexpr uint32_t max        = 0xffffff00;
constexpr uint32_t in_port    = 0xfffffff8;
constexpr uint32_t flood      = 0xfffffffb;
constexpr uint32_t all        = 0xfffffffc;
constexpr uint32_t controller = 0xfffffffd;
constexpr uint32_t any        = 0xffffffff;
}

/** Buffer id meaning "the packet was not buffered by the switch". */
constexpr uint32_t no_buffer = 0xffffffff;

namespace priority {
constexpr uint16_t table_miss = 0;
// Below every exact-match rule installed by the learning switch
constexpr uint16_t capture    = 10;
constexpr uint16_t exact      = 100;
// Spoof drop rules must survive a forwarding rule for the same flow
constexpr uint16_t spoof_drop = 200;
}

struct FlowMatch {
    std::optional<uint32_t> in_port;
    std::optional<ethaddr>  eth_src;
    std::optional<ethaddr>  eth_dst;
    std::optional<uint16_t> eth_type;
    std::optional<uint16_t> vlan_id;

    std::optional<uint16_t> arp_op;
    std::optional<IPv4Addr> arp_spa;
    std::optional<IPv4Addr> arp_tpa;

    std::optional<IPv4Addr> ip_src;
    std::optional<IPv4Addr> ip_dst;
    std::optional<uint8_t>  ip_proto;

    std::optional<uint16_t> tp_src;
    std::optional<uint16_t> tp_dst;

    /**
     * Matches exactly the flow `pkt` belongs to.
     * In-port is included only when given.
     */
    static FlowMatch exact(const PacketInfo& pkt,
                           std::optional<uint32_t> in_port = std::nullopt);
};

struct FlowRule {
    using duration = std::chrono::duration<uint16_t>;

    FlowMatch match;
    // Empty list drops matching packets
    std::vector<uint32_t> out_ports;
    uint16_t priority {priority::exact};
    // Zero is permanent
    duration idle_timeout {0};
    duration hard_timeout {0};
    // Buffered packet to run through the new rule
    std::optional<uint32_t> buffer_id;
};

struct PacketOut {
    uint32_t in_port {port::controller};
    std::optional<uint32_t> buffer_id;
    // Sent when the switch did not buffer the packet
    std::vector<uint8_t> data;
    // Empty list drops the buffered packet
    std::vector<uint32_t> out_ports;
};

std::ostream& operator<<(std::ostream& out, const FlowMatch& match);
std::ostream& operator<<(std::ostream& out, const FlowRule& rule);
std::ostream& operator<<(std::ostream& out, const PacketOut& po);

} // namespace arpguard
