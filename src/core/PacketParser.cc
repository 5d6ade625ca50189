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

#include "PacketParser.hpp"

#include <arpguard/core/throw.hpp>

#include <boost/endian/arithmetic.hpp>

#include <cstring>

namespace arpguard {

using namespace boost::endian;

namespace {

struct EthHeader {
    big_uint48_t dst;
    big_uint48_t src;
    big_uint16_t type;
};

struct VlanTag {
    big_uint16_t tci;
    big_uint16_t type;
};

struct ArpPayload {
    big_uint16_t htype;
    big_uint16_t ptype;
    big_uint8_t  hlen;
    big_uint8_t  plen;
    big_uint16_t oper;
    big_uint48_t sha;
    big_uint32_t spa;
    big_uint48_t tha;
    big_uint32_t tpa;
};

struct IPv4Header {
    big_uint8_t  version_ihl;
    big_uint8_t  tos;
    big_uint16_t total_len;
    big_uint16_t id;
    big_uint16_t frag;
    big_uint8_t  ttl;
    big_uint8_t  proto;
    big_uint16_t checksum;
    big_uint32_t src;
    big_uint32_t dst;
};

struct TransportPorts {
    big_uint16_t src;
    big_uint16_t dst;
};

struct UdpTail {
    big_uint16_t len;
    big_uint16_t checksum;
};

struct BootpHeader {
    big_uint8_t  op;
    big_uint8_t  htype;
    big_uint8_t  hlen;
    big_uint8_t  hops;
    big_uint32_t xid;
    big_uint16_t secs;
    big_uint16_t flags;
    big_uint32_t ciaddr;
    big_uint32_t yiaddr;
    big_uint32_t siaddr;
    big_uint32_t giaddr;
    big_uint48_t chaddr;
    uint8_t      chaddr_pad[10];
    uint8_t      sname[64];
    uint8_t      file[128];
    big_uint32_t magic;
};

static_assert(sizeof(EthHeader) == 14, "unexpected padding");
static_assert(sizeof(VlanTag) == 4, "unexpected padding");
static_assert(sizeof(ArpPayload) == 28, "unexpected padding");
static_assert(sizeof(IPv4Header) == 20, "unexpected padding");
static_assert(sizeof(BootpHeader) == 240, "unexpected padding");

constexpr uint16_t frag_offset_mask = 0x1fff;

namespace dhcp {
constexpr uint16_t server_port  = 67;
constexpr uint16_t client_port  = 68;
constexpr uint8_t  boot_reply   = 2;
constexpr uint32_t magic_cookie = 0x63825363;

constexpr uint8_t  opt_pad          = 0;
constexpr uint8_t  opt_message_type = 53;
constexpr uint8_t  opt_end          = 255;
constexpr uint8_t  ack              = 5;
}

class Reader {
    const uint8_t* data;
    size_t len;
    size_t pos {0};
public:
    Reader(const uint8_t* data, size_t len)
        : data(data), len(len)
    { }

    size_t left() const { return len - pos; }

    void skip(size_t n) { pos += n; }

    uint8_t byte(const char* layer)
    { return take<big_uint8_t>(layer); }

    template<class Header>
    Header take(const char* layer)
    {
        Header ret;
        ARPGUARD_THROW_IF(left() < sizeof(Header),
            malformed_packet(layer, left()),
            "Truncated {} header: {} bytes of {}", layer, left(), sizeof(Header));
        std::memcpy(&ret, data + pos, sizeof(Header));
        pos += sizeof(Header);
        return ret;
    }
};

void parse_arp(Reader& r, PacketInfo& pkt)
{
    auto arp = r.take<ArpPayload>("arp");
    ARPGUARD_THROW_IF(arp.htype != 1 || arp.ptype != ethertype::ipv4 ||
                      arp.hlen != ethaddr::nbytes || arp.plen != IPv4Addr::nbytes,
        malformed_packet("arp", sizeof(ArpPayload)),
        "Unsupported ARP format: htype={} ptype={:#x} hlen={} plen={}",
        uint16_t(arp.htype), uint16_t(arp.ptype),
        unsigned(arp.hlen), unsigned(arp.plen));

    pkt.arp = ArpHeader{
        uint16_t(arp.oper),
        ethaddr(uint64_t(arp.sha)),
        IPv4Addr(uint32_t(arp.spa)),
        ethaddr(uint64_t(arp.tha)),
        IPv4Addr(uint32_t(arp.tpa))
    };
}

// Only server replies are decoded; requests carry no lease.
void parse_dhcp(Reader& r, PacketInfo& pkt)
{
    r.take<UdpTail>("udp");
    auto bootp = r.take<BootpHeader>("dhcp");
    if (bootp.op != dhcp::boot_reply || bootp.htype != 1 ||
        bootp.hlen != ethaddr::nbytes || bootp.magic != dhcp::magic_cookie)
        return;

    std::optional<uint8_t> message_type;
    while (r.left() > 0) {
        uint8_t code = r.byte("dhcp");
        if (code == dhcp::opt_pad)
            continue;
        if (code == dhcp::opt_end)
            break;

        uint8_t len = r.byte("dhcp");
        ARPGUARD_THROW_IF(r.left() < len,
            malformed_packet("dhcp", r.left()),
            "DHCP option {} overruns the packet: {} bytes of {}",
            unsigned(code), r.left(), unsigned(len));

        if (code == dhcp::opt_message_type && len == 1) {
            message_type = r.byte("dhcp");
        } else {
            r.skip(len);
        }
    }

    IPv4Addr yiaddr(uint32_t(bootp.yiaddr));
    if (message_type == dhcp::ack && not is_unspecified(yiaddr)) {
        pkt.dhcp_ack = DhcpLease{yiaddr, ethaddr(uint64_t(bootp.chaddr))};
    }
}

void parse_ipv4(Reader& r, PacketInfo& pkt)
{
    auto ip = r.take<IPv4Header>("ipv4");
    size_t ihl = (ip.version_ihl & 0x0f) * 4;
    ARPGUARD_THROW_IF(ihl < sizeof(IPv4Header) ||
                      r.left() < ihl - sizeof(IPv4Header),
        malformed_packet("ipv4", r.left() + sizeof(IPv4Header)),
        "Bad IPv4 header length {}", ihl);
    r.skip(ihl - sizeof(IPv4Header));

    pkt.ip_src = IPv4Addr(uint32_t(ip.src));
    pkt.ip_dst = IPv4Addr(uint32_t(ip.dst));
    pkt.ip_proto = uint8_t(ip.proto);

    // Only the first fragment carries the transport header
    if ((ip.frag & frag_offset_mask) != 0)
        return;

    if (ip.proto == ipproto::tcp || ip.proto == ipproto::udp) {
        auto ports = r.take<TransportPorts>(
                ip.proto == ipproto::tcp ? "tcp" : "udp");
        pkt.tp_src = uint16_t(ports.src);
        pkt.tp_dst = uint16_t(ports.dst);
    }

    if (ip.proto == ipproto::udp && pkt.tp_src == dhcp::server_port &&
        pkt.tp_dst == dhcp::client_port)
        parse_dhcp(r, pkt);
}

} // namespace

PacketInfo parse_packet(const uint8_t* data, size_t len)
{
    Reader r{data, len};
    PacketInfo pkt;

    auto eth = r.take<EthHeader>("ethernet");
    pkt.eth_dst = ethaddr(uint64_t(eth.dst));
    pkt.eth_src = ethaddr(uint64_t(eth.src));
    pkt.eth_type = eth.type;

    if (pkt.eth_type == ethertype::vlan) {
        auto tag = r.take<VlanTag>("vlan");
        pkt.vlan_id = uint16_t(tag.tci & 0x0fff);
        pkt.eth_type = tag.type;
    }

    switch (pkt.eth_type) {
    case ethertype::arp:
        parse_arp(r, pkt);
        break;
    case ethertype::ipv4:
        parse_ipv4(r, pkt);
        break;
    default:
        break;
    }

    return pkt;
}

std::ostream& operator<<(std::ostream& out, const PacketInfo& pkt)
{
    out << pkt.eth_src << " -> " << pkt.eth_dst
        << " type=" << std::hex << std::showbase << pkt.eth_type
        << std::dec << std::noshowbase;
    if (pkt.vlan_id) {
        out << " vlan=" << *pkt.vlan_id;
    }
    if (pkt.arp) {
        out << (pkt.arp->opcode == arp_op::request ? " arp-request " :
                pkt.arp->opcode == arp_op::reply ? " arp-reply " : " arp ")
            << pkt.arp->spa << " (" << pkt.arp->sha << ") -> "
            << pkt.arp->tpa << " (" << pkt.arp->tha << ")";
    }
    if (pkt.ip_src && pkt.ip_dst) {
        out << " ip " << *pkt.ip_src << " -> " << *pkt.ip_dst
            << " proto=" << unsigned(pkt.ip_proto.value_or(0));
    }
    if (pkt.tp_src && pkt.tp_dst) {
        out << " ports " << *pkt.tp_src << " -> " << *pkt.tp_dst;
    }
    if (pkt.dhcp_ack) {
        out << " dhcp-ack " << pkt.dhcp_ack->ip
            << " for " << pkt.dhcp_ack->mac;
    }
    return out;
}

} // namespace arpguard
