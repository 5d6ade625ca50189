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
#include "FlowRule.hpp"
#include "PacketParser.hpp"
#include "ArpValidator.hpp"
#include "api/SwitchConnection.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace arpguard {

/**
 * Packet sent to the controller by a switch.
 */
struct PacketIn {
    uint32_t in_port;
    std::optional<uint32_t> buffer_id;
    // Raw frame as received
    std::vector<uint8_t> data;
    PacketInfo pkt;
    clock::time_point arrival;
};

/**
 * L2 learning switch with ARP spoofing detection, one per connection.
 *
 * Not thread-safe: events of a single connection must be delivered in order
 * from one context at a time.
 */
class LearningSwitch {
public:
    struct Settings {
        // Forward link-local and bridge-filtered frames instead of dropping
        bool transparent {false};
        // No flooding until the connection is this old
        std::chrono::seconds hold_down {0};
        // Stop processing after every spoof, not only the fatal ones
        bool halt_on_spoof {false};

        FlowRule::duration forward_idle {10};
        FlowRule::duration forward_hard {30};
        FlowRule::duration loop_idle {10};
        FlowRule::duration loop_hard {10};
        FlowRule::duration spoof_idle {10};
        FlowRule::duration spoof_hard {60};
    };

    struct Counters {
        uint64_t spoofs {0};
        uint64_t loops {0};
        uint64_t floods {0};
        uint64_t suppressed_floods {0};
        uint64_t forwards {0};
        uint64_t drops {0};
    };

    LearningSwitch(SwitchConnectionPtr conn,
                   ArpValidator& validator,
                   Settings settings);

    /** Installs the ARP and DHCP capture rules. Call once per connection. */
    void setup();

    void process(const PacketIn& in);

    std::optional<uint32_t> port_of(ethaddr mac) const;

    /** True once the hold-down period has been observed to elapse. */
    bool flood_enabled() const { return flood_enabled_; }

    const Counters& counters() const { return counters_; }
    const Settings& settings() const { return settings_; }
    uint64_t dpid() const { return conn_->dpid(); }

private:
    void spoof(const PacketIn& in, const Verdict& verdict, bool halt);
    void flood(const PacketIn& in, const char* unknown_dst_note = nullptr);
    void drop(const PacketIn& in);
    void drop_for(const PacketIn& in, FlowRule::duration idle,
                  FlowRule::duration hard);
    void forward(const PacketIn& in, uint32_t out_port);

    bool hold_down_passed(clock::time_point now);
    PacketOut packet_out(const PacketIn& in,
                         std::vector<uint32_t> out_ports) const;

    SwitchConnectionPtr conn_;
    ArpValidator& validator_;
    Settings settings_;

    std::unordered_map<ethaddr, uint32_t> mac_to_port_;
    bool flood_enabled_ {false};
    Counters counters_;
};

} // namespace arpguard
