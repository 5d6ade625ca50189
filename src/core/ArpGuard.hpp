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
#include "AddressBindingTable.hpp"
#include "PendingRequestTracker.hpp"
#include "ArpValidator.hpp"
#include "ExpiryWatchdog.hpp"
#include "LearningSwitch.hpp"
#include "api/SwitchConnection.hpp"

#include <boost/thread/shared_mutex.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace arpguard {

/**
 * Owns the shared registries, the watchdog and one learning switch per
 * connected switch, and routes control-plane events to them.
 *
 * Every event handler contains its own failures: exceptions are logged
 * and never reach the caller.
 */
class ArpGuard {
public:
    struct Settings {
        LearningSwitch::Settings learning_switch;
        std::chrono::milliseconds sweep_interval {1000};
        clock::duration request_timeout {std::chrono::seconds(5)};
    };

    explicit ArpGuard(Settings settings);
    ~ArpGuard();

    /** New connection. Replaces the engine of a reconnecting switch. */
    void connection_up(SwitchConnectionPtr conn);
    void connection_down(uint64_t dpid);

    void packet_in(uint64_t dpid,
                   uint32_t in_port,
                   std::optional<uint32_t> buffer_id,
                   std::vector<uint8_t> data,
                   clock::time_point arrival = clock::now());

    void address_leased(IPv4Addr ip, ethaddr mac);

    /** Starts and stops the expiry watchdog. */
    void start();
    void stop();

    AddressBindingTable& bindings() { return bindings_; }
    PendingRequestTracker& requests() { return requests_; }
    ExpiryWatchdog& watchdog() { return watchdog_; }

    std::shared_ptr<LearningSwitch> engine(uint64_t dpid) const;
    size_t engines() const;

private:
    Settings settings_;
    AddressBindingTable bindings_;
    PendingRequestTracker requests_;
    ArpValidator validator_;
    ExpiryWatchdog watchdog_;

    mutable boost::shared_mutex engines_mutex_;
    std::unordered_map<uint64_t, std::shared_ptr<LearningSwitch>> engines_;
};

} // namespace arpguard
