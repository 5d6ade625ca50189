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

/** @file Common.hpp
  * @brief Common definitions shared by the core.
  */
#pragma once

#include <chrono>
#include <cstdint>

namespace arpguard {

/** Monotonic clock used for every timestamp in the core. */
using clock = std::chrono::steady_clock;

namespace ethertype {
constexpr uint16_t ipv4 = 0x0800;
constexpr uint16_t arp  = 0x0806;
constexpr uint16_t vlan = 0x8100;
constexpr uint16_t lldp = 0x88cc;
}

namespace ipproto {
constexpr uint8_t tcp = 6;
constexpr uint8_t udp = 17;
}

} // namespace arpguard
