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

#include "FlowRule.hpp"

namespace arpguard {

FlowMatch FlowMatch::exact(const PacketInfo& pkt,
                           std::optional<uint32_t> in_port)
{
    FlowMatch ret;
    ret.in_port = in_port;
    ret.eth_src = pkt.eth_src;
    ret.eth_dst = pkt.eth_dst;
    ret.eth_type = pkt.eth_type;
    ret.vlan_id = pkt.vlan_id;

    if (pkt.arp) {
        ret.arp_op = pkt.arp->opcode;
        ret.arp_spa = pkt.arp->spa;
        ret.arp_tpa = pkt.arp->tpa;
    }

    ret.ip_src = pkt.ip_src;
    ret.ip_dst = pkt.ip_dst;
    ret.ip_proto = pkt.ip_proto;
    ret.tp_src = pkt.tp_src;
    ret.tp_dst = pkt.tp_dst;

    return ret;
}

namespace {

template<class T>
void print_field(std::ostream& out, const char* name,
                 const std::optional<T>& value)
{
    if (value)
        out << name << '=' << *value << ' ';
}

void print_ports(std::ostream& out, const std::vector<uint32_t>& ports)
{
    if (ports.empty()) {
        out << "drop";
        return;
    }

    for (auto p : ports) {
        switch (p) {
        case port::flood:      out << "flood "; break;
        case port::controller: out << "controller "; break;
        case port::all:        out << "all "; break;
        case port::in_port:    out << "in_port "; break;
        default:               out << p << ' '; break;
        }
    }
}

} // namespace

std::ostream& operator<<(std::ostream& out, const FlowMatch& m)
{
    out << "{ ";
    print_field(out, "in_port", m.in_port);
    print_field(out, "eth_src", m.eth_src);
    print_field(out, "eth_dst", m.eth_dst);
    if (m.eth_type)
        out << "eth_type=" << std::hex << *m.eth_type << std::dec << ' ';
    print_field(out, "vlan_id", m.vlan_id);
    print_field(out, "arp_op", m.arp_op);
    print_field(out, "arp_spa", m.arp_spa);
    print_field(out, "arp_tpa", m.arp_tpa);
    print_field(out, "ip_src", m.ip_src);
    print_field(out, "ip_dst", m.ip_dst);
    if (m.ip_proto)
        out << "ip_proto=" << unsigned(*m.ip_proto) << ' ';
    print_field(out, "tp_src", m.tp_src);
    print_field(out, "tp_dst", m.tp_dst);
    return out << '}';
}

std::ostream& operator<<(std::ostream& out, const FlowRule& rule)
{
    out << "prio=" << rule.priority << " match=" << rule.match
        << " idle=" << rule.idle_timeout.count()
        << " hard=" << rule.hard_timeout.count() << " actions=";
    print_ports(out, rule.out_ports);
    if (rule.buffer_id)
        out << " buffer_id=" << *rule.buffer_id;
    return out;
}

std::ostream& operator<<(std::ostream& out, const PacketOut& po)
{
    out << "in_port=" << po.in_port;
    if (po.buffer_id)
        out << " buffer_id=" << *po.buffer_id;
    else
        out << " data_len=" << po.data.size();
    out << " actions=";
    print_ports(out, po.out_ports);
    return out;
}

} // namespace arpguard
