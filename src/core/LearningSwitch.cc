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

#include "LearningSwitch.hpp"

#include <arpguard/core/logging.hpp>
#include <arpguard/core/throw.hpp>

#include <utility>

namespace arpguard {

namespace {

constexpr uint16_t dhcp_server_port = 67;
constexpr uint16_t dhcp_client_port = 68;

} // namespace

LearningSwitch::LearningSwitch(SwitchConnectionPtr conn,
                               ArpValidator& validator,
                               Settings settings)
    : conn_(std::move(conn))
    , validator_(validator)
    , settings_(settings)
{
    ARPGUARD_THROW_IF(not conn_, invalid_argument{},
                      "Learning switch needs a connection");
}

void LearningSwitch::setup()
{
    FlowRule arp;
    arp.match.eth_type = ethertype::arp;
    arp.out_ports = {port::controller};
    arp.priority = priority::capture;
    conn_->install(arp);

    FlowRule dhcp;
    dhcp.match.eth_type = ethertype::ipv4;
    dhcp.match.ip_proto = ipproto::udp;
    dhcp.match.tp_src = dhcp_server_port;
    dhcp.match.tp_dst = dhcp_client_port;
    dhcp.out_ports = {port::controller};
    dhcp.priority = priority::capture;
    conn_->install(dhcp);

    VLOG(1) << "[LearningSwitch] dpid=" << dpid()
            << ": ARP and DHCP capture rules installed";
}

void LearningSwitch::process(const PacketIn& in)
{
    const auto& pkt = in.pkt;

    if (pkt.is_arp()) {
        auto verdict = validator_.validate(pkt, in.arrival);
        if (verdict.is_spoof()) {
            bool halt = settings_.halt_on_spoof ||
                        verdict.disposition() == Verdict::Halt;
            spoof(in, verdict, halt);
            if (halt)
                return;
        }
    }

    auto& learned = mac_to_port_[pkt.eth_src];
    DLOG_IF(INFO, learned != 0 && learned != in.in_port)
        << "[LearningSwitch] dpid=" << dpid() << ": " << pkt.eth_src
        << " moved from port " << learned << " to " << in.in_port;
    learned = in.in_port;

    if (not settings_.transparent) {
        if (pkt.eth_type == ethertype::lldp || is_bridge_filtered(pkt.eth_dst)) {
            drop(in);
            return;
        }
    }

    if (is_multicast(pkt.eth_dst)) {
        flood(in);
        return;
    }

    auto it = mac_to_port_.find(pkt.eth_dst);
    if (it == mac_to_port_.end()) {
        flood(in, "destination unknown");
        return;
    }

    uint32_t out_port = it->second;
    if (out_port == in.in_port) {
        LOG(WARNING) << "[LearningSwitch] Same port for packet from "
                     << pkt.eth_src << " -> " << pkt.eth_dst << " on "
                     << dpid() << '.' << out_port << ". Drop.";
        ++counters_.loops;
        drop_for(in, settings_.loop_idle, settings_.loop_hard);
        return;
    }

    forward(in, out_port);
}

std::optional<uint32_t> LearningSwitch::port_of(ethaddr mac) const
{
    auto it = mac_to_port_.find(mac);
    if (it == mac_to_port_.end())
        return std::nullopt;
    return it->second;
}

void LearningSwitch::spoof(const PacketIn& in, const Verdict& verdict,
                           bool halt)
{
    ++counters_.spoofs;
    LOG(WARNING) << "[LearningSwitch] ARP spoofing detected on dpid="
                 << dpid() << " port=" << in.in_port << ": " << verdict
                 << " [" << in.pkt << "]";

    FlowRule rule;
    rule.match = FlowMatch::exact(in.pkt, in.in_port);
    rule.priority = priority::spoof_drop;
    rule.idle_timeout = settings_.spoof_idle;
    rule.hard_timeout = settings_.spoof_hard;
    // The buffered packet still belongs to the forwarding path unless
    // processing stops here
    if (halt)
        rule.buffer_id = in.buffer_id;
    conn_->install(rule);
}

bool LearningSwitch::hold_down_passed(clock::time_point now)
{
    if (flood_enabled_)
        return true;

    if (now - conn_->connected_since() < settings_.hold_down)
        return false;

    flood_enabled_ = true;
    LOG(INFO) << "[LearningSwitch] dpid=" << dpid()
              << ": Flood hold-down expired -- flooding";
    return true;
}

void LearningSwitch::flood(const PacketIn& in, const char* unknown_dst_note)
{
    if (not hold_down_passed(in.arrival)) {
        ++counters_.suppressed_floods;
        VLOG(5) << "[LearningSwitch] Holding down flood for dpid=" << dpid();
        if (in.buffer_id)
            conn_->send(packet_out(in, {}));
        return;
    }

    if (unknown_dst_note) {
        VLOG(3) << "[LearningSwitch] Port for " << in.pkt.eth_dst
                << " unknown -- flooding";
    }

    ++counters_.floods;
    conn_->send(packet_out(in, {port::flood}));
}

void LearningSwitch::drop(const PacketIn& in)
{
    ++counters_.drops;
    if (in.buffer_id)
        conn_->send(packet_out(in, {}));
}

void LearningSwitch::drop_for(const PacketIn& in, FlowRule::duration idle,
                              FlowRule::duration hard)
{
    ++counters_.drops;

    FlowRule rule;
    rule.match = FlowMatch::exact(in.pkt);
    rule.idle_timeout = idle;
    rule.hard_timeout = hard;
    rule.buffer_id = in.buffer_id;
    conn_->install(rule);
}

void LearningSwitch::forward(const PacketIn& in, uint32_t out_port)
{
    VLOG(4) << "[LearningSwitch] Installing flow for "
            << in.pkt.eth_src << '.' << in.in_port << " -> "
            << in.pkt.eth_dst << '.' << out_port;

    ++counters_.forwards;

    FlowRule rule;
    rule.match = FlowMatch::exact(in.pkt, in.in_port);
    rule.out_ports = {out_port};
    rule.idle_timeout = settings_.forward_idle;
    rule.hard_timeout = settings_.forward_hard;
    conn_->install(rule);

    conn_->send(packet_out(in, {out_port}));
}

PacketOut LearningSwitch::packet_out(const PacketIn& in,
                                     std::vector<uint32_t> out_ports) const
{
    PacketOut po;
    po.in_port = in.in_port;
    po.buffer_id = in.buffer_id;
    if (not in.buffer_id)
        po.data = in.data;
    po.out_ports = std::move(out_ports);
    return po;
}

} // namespace arpguard
