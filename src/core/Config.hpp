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

/** @file */
#pragma once

#include "ArpGuard.hpp"
#include "types/ethaddr.hh"
#include "types/IPv4Addr.hh"

#include <json11.hpp>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace arpguard {

/**
 * @brief Settings file contents
 * @details Settings are read from `arpguard-settings.json`, one JSON object
 * per profile. Sections used: `controller`, `learning-switch`, `arp-guard`.
 */
typedef json11::Json::object Config;

/**
 * @brief change directory
 * @details `config_cd(config, "arp-guard")` returns the `arp-guard` object,
 * or an empty section if there is none.
 */
inline Config config_cd(const Config& config,
                        const std::string& key)
{
    auto it = config.find(key);
    return (it != config.end()) ?
        it->second.object_items() : Config();
}

/**
 * Reads profile `profile` of a settings file.
 * @throws config_error if the file can't be read or parsed.
 */
Config loadConfig(const std::string& fileName,
                  const std::string& profile = "default");

struct ControllerSettings {
    std::string address {"0.0.0.0"};
    int port {6653};
    int nthreads {4};
    int echo_interval {15};
    bool liveness_check {true};
};

using BindingList = std::vector< std::pair<IPv4Addr, ethaddr> >;

struct Settings {
    ControllerSettings controller;
    ArpGuard::Settings guard;
    // Registered at startup as if leased
    BindingList bindings;
};

/**
 * Validates and converts a loaded profile.
 * Missing keys keep their defaults.
 * @throws config_error naming the first invalid key.
 */
Settings read_settings(const Config& config);

/** Accepts true/false, yes/no, on/off and 1/0. */
bool parse_flag(const std::string& key, const std::string& value);

/** Non-negative base-10 number of seconds. */
std::chrono::seconds parse_hold_down(const std::string& key,
                                     const std::string& value);

} // namespace arpguard
