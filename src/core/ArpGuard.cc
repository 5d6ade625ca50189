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

#include "ArpGuard.hpp"
#include "PacketParser.hpp"

#include <arpguard/core/catch_all.hpp>
#include <arpguard/core/logging.hpp>

#include <boost/thread/locks.hpp>

#include <utility>

namespace arpguard {

ArpGuard::ArpGuard(Settings settings)
    : settings_(std::move(settings))
    , validator_(bindings_, requests_)
    , watchdog_(requests_, settings_.sweep_interval, settings_.request_timeout)
{ }

ArpGuard::~ArpGuard() = default;

void ArpGuard::connection_up(SwitchConnectionPtr conn)
{ catch_all_and_log([&]() {
    auto engine = std::make_shared<LearningSwitch>(
            conn, validator_, settings_.learning_switch);
    auto dpid = engine->dpid();
    engine->setup();

    bool replaced;
    {
        boost::unique_lock< boost::shared_mutex > lock(engines_mutex_);
        replaced = not engines_.insert_or_assign(dpid, engine).second;
    }

    LOG(INFO) << "[ArpGuard] Switch dpid=" << dpid << " connected"
              << (replaced ? ", previous MAC table discarded" : "");
}); }

void ArpGuard::connection_down(uint64_t dpid)
{ catch_all_and_log([&]() {
    std::shared_ptr<LearningSwitch> engine;
    {
        boost::unique_lock< boost::shared_mutex > lock(engines_mutex_);
        auto it = engines_.find(dpid);
        if (it == engines_.end()) {
            VLOG(1) << "[ArpGuard] Unknown switch dpid=" << dpid
                    << " disconnected";
            return;
        }
        engine = std::move(it->second);
        engines_.erase(it);
    }

    const auto& c = engine->counters();
    LOG(INFO) << "[ArpGuard] Switch dpid=" << dpid << " disconnected:"
              << " spoofs=" << c.spoofs
              << " loops=" << c.loops
              << " floods=" << c.floods
              << " suppressed_floods=" << c.suppressed_floods
              << " forwards=" << c.forwards
              << " drops=" << c.drops;
}); }

void ArpGuard::packet_in(uint64_t dpid,
                         uint32_t in_port,
                         std::optional<uint32_t> buffer_id,
                         std::vector<uint8_t> data,
                         clock::time_point arrival)
{ catch_all_and_log([&]() {
    auto engine = this->engine(dpid);
    if (not engine) {
        LOG(WARNING) << "[ArpGuard] Packet-in from unknown switch dpid="
                     << dpid << " ignored";
        return;
    }

    PacketIn in{in_port, buffer_id, std::move(data), PacketInfo{}, arrival};
    try {
        in.pkt = parse_packet(in.data.data(), in.data.size());
    } catch (malformed_packet& e) {
        LOG(WARNING) << "[ArpGuard] Malformed packet from dpid=" << dpid
                     << " port=" << in_port << " dropped: " << e.what();
        return;
    }

    VLOG(10) << "[ArpGuard] dpid=" << dpid << " port=" << in_port
             << ": " << in.pkt;

    if (in.pkt.dhcp_ack) {
        LOG(INFO) << "[ArpGuard] DHCP lease on dpid=" << dpid
                  << " port=" << in_port << ": " << in.pkt.dhcp_ack->ip
                  << " -> " << in.pkt.dhcp_ack->mac;
        address_leased(in.pkt.dhcp_ack->ip, in.pkt.dhcp_ack->mac);
    }
    engine->process(in);
}); }

void ArpGuard::address_leased(IPv4Addr ip, ethaddr mac)
{
    bindings_.assign(ip, mac);
    VLOG(1) << "[ArpGuard] Address " << ip << " bound to " << mac;
}

void ArpGuard::start()
{
    watchdog_.start();
}

void ArpGuard::stop()
{
    watchdog_.stop();
}

std::shared_ptr<LearningSwitch> ArpGuard::engine(uint64_t dpid) const
{
    boost::shared_lock< boost::shared_mutex > lock(engines_mutex_);
    auto it = engines_.find(dpid);
    return it != engines_.end() ? it->second : nullptr;
}

size_t ArpGuard::engines() const
{
    boost::shared_lock< boost::shared_mutex > lock(engines_mutex_);
    return engines_.size();
}

} // namespace arpguard
