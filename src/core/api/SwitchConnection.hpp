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

#include "../Common.hpp"
#include "../FlowRule.hpp"

#include <cstdint>
#include <memory>

namespace arpguard {

/**
 * Connection with a switch as seen by the core.
 *
 * Requests are fire-and-forget. Implementations never throw for delivery
 * problems: a request to a closed connection is logged and dropped.
 */
class SwitchConnection {
public:
    virtual ~SwitchConnection() = default;

    virtual uint64_t dpid() const = 0;

    /** When the connection was established, used for flood hold-down. */
    virtual clock::time_point connected_since() const = 0;

    virtual void install(const FlowRule& rule) = 0;
    virtual void send(const PacketOut& po) = 0;
};

typedef std::shared_ptr<SwitchConnection> SwitchConnectionPtr;

} // namespace arpguard
