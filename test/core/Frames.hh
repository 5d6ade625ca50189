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

#include <vector>
#include <optional>

#include "core/Common.hpp"
#include "core/PacketParser.hpp"
#include "core/LearningSwitch.hpp"

namespace arpguard {
namespace test {

using frame = std::vector<uint8_t>;

inline void put8(frame& f, uint8_t x)
{ f.push_back(x); }

inline void put16(frame& f, uint16_t x)
{
    f.push_back(uint8_t(x >> 8));
    f.push_back(uint8_t(x & 0xff));
}

inline void put(frame& f, ethaddr mac)
{
    auto octets = mac.to_octets();
    f.insert(f.end(), octets.begin(), octets.end());
}

inline void put(frame& f, IPv4Addr ip)
{
    auto octets = ip.to_octets();
    f.insert(f.end(), octets.begin(), octets.end());
}

inline frame eth_header(ethaddr dst, ethaddr src, uint16_t type)
{
    frame f;
    put(f, dst);
    put(f, src);
    put16(f, type);
    return f;
}

// Ethernet frame with an opaque payload padded to the minimal size
inline frame raw_frame(ethaddr src, ethaddr dst, uint16_t type = 0x88b5)
{
    frame f = eth_header(dst, src, type);
    f.resize(60, 0);
    return f;
}

inline frame arp_frame(uint16_t op,
                       ethaddr eth_src, ethaddr eth_dst,
                       ethaddr sha, IPv4Addr spa,
                       ethaddr tha, IPv4Addr tpa)
{
    frame f = eth_header(eth_dst, eth_src, ethertype::arp);
    put16(f, 1);
    put16(f, ethertype::ipv4);
    put8(f, 6);
    put8(f, 4);
    put16(f, op);
    put(f, sha);
    put(f, spa);
    put(f, tha);
    put(f, tpa);
    f.resize(60, 0);
    return f;
}

inline frame udp_frame(ethaddr eth_src, ethaddr eth_dst,
                       IPv4Addr src, IPv4Addr dst,
                       uint16_t sport, uint16_t dport)
{
    frame f = eth_header(eth_dst, eth_src, ethertype::ipv4);
    put8(f, 0x45);         // version, ihl
    put8(f, 0);            // tos
    put16(f, 20 + 8);      // total length
    put16(f, 0);           // id
    put16(f, 0);           // flags, fragment offset
    put8(f, 64);           // ttl
    put8(f, ipproto::udp);
    put16(f, 0);           // checksum
    put(f, src);
    put(f, dst);
    put16(f, sport);
    put16(f, dport);
    put16(f, 8);
    put16(f, 0);
    f.resize(60, 0);
    return f;
}

inline void put32(frame& f, uint32_t x)
{
    put16(f, uint16_t(x >> 16));
    put16(f, uint16_t(x & 0xffff));
}

// DHCP server reply carrying a single message type option
inline frame dhcp_frame(ethaddr server_mac, ethaddr client_mac,
                        IPv4Addr server_ip, IPv4Addr yiaddr,
                        ethaddr chaddr, uint8_t msg_type)
{
    const uint16_t options_len = 3 + 1;
    const uint16_t bootp_len = 240 + options_len;

    frame f = eth_header(client_mac, server_mac, ethertype::ipv4);
    put8(f, 0x45);
    put8(f, 0);
    put16(f, 20 + 8 + bootp_len);
    put16(f, 0);
    put16(f, 0);
    put8(f, 64);
    put8(f, ipproto::udp);
    put16(f, 0);
    put(f, server_ip);
    put(f, yiaddr);

    put16(f, 67);
    put16(f, 68);
    put16(f, 8 + bootp_len);
    put16(f, 0);

    put8(f, 2);            // op: boot reply
    put8(f, 1);            // htype: ethernet
    put8(f, 6);            // hlen
    put8(f, 0);            // hops
    put32(f, 0x3903f326);  // xid
    put16(f, 0);           // secs
    put16(f, 0);           // flags
    put32(f, 0);           // ciaddr
    put(f, yiaddr);
    put(f, server_ip);     // siaddr
    put32(f, 0);           // giaddr
    put(f, chaddr);
    f.resize(f.size() + 10 + 64 + 128, 0);
    put32(f, 0x63825363);

    put8(f, 53);
    put8(f, 1);
    put8(f, msg_type);
    put8(f, 255);
    return f;
}

inline PacketIn packet_in(uint32_t in_port, frame data,
                          clock::time_point arrival,
                          std::optional<uint32_t> buffer_id = std::nullopt)
{
    PacketInfo pkt = parse_packet(data.data(), data.size());
    return PacketIn{in_port, buffer_id, std::move(data), pkt, arrival};
}

} // namespace test
} // namespace arpguard
