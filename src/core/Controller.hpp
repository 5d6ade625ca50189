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

#include "Config.hpp"
#include "ArpGuard.hpp"

#include <memory>

namespace arpguard {

/**
 * OpenFlow 1.3 front end.
 *
 * Accepts switch connections with libfluid, turns FEATURES_REPLY,
 * PACKET_IN and connection loss into ArpGuard events, and sends the
 * resulting flow rules and packet-outs back to the switches.
 */
class Controller {
public:
    Controller(ArpGuard& guard, const ControllerSettings& settings);
    ~Controller();

    /** Starts listening. Doesn't block. */
    void start();
    void stop();

private:
    struct implementation;
    std::unique_ptr<implementation> impl;
};

} // namespace arpguard
