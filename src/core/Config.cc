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

#include "Config.hpp"

#include <arpguard/core/throw.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

namespace arpguard {

using json11::Json;

Config loadConfig(const std::string& fileName,
                  const std::string& profile)
{
    std::ifstream file(fileName);
    ARPGUARD_THROW_IF(not file, config_error{"conf"},
                      "Can't read settings file '{}'", fileName);

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string parseMessage;
    Json root = Json::parse(buffer.str(), parseMessage);
    ARPGUARD_THROW_IF(not parseMessage.empty(), config_error{"conf"},
                      "Can't parse settings file '{}': {}",
                      fileName, parseMessage);

    const Json& section = root[profile];
    ARPGUARD_THROW_IF(not section.is_object(), config_error{profile},
                      "No profile '{}' in settings file '{}'",
                      profile, fileName);

    return section.object_items();
}

bool parse_flag(const std::string& key, const std::string& value)
{
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (v == "true" || v == "yes" || v == "on" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "off" || v == "0")
        return false;

    ARPGUARD_THROW(config_error{key},
                   "Invalid value '{}' for '{}': expected a boolean",
                   value, key);
}

namespace {

long long parse_integer(const std::string& key, const std::string& value,
                        long long min, long long max)
{
    bool digits = not value.empty() && value.size() <= 18 &&
        std::all_of(value.begin(), value.end(),
                    [](unsigned char c) { return std::isdigit(c); });
    ARPGUARD_THROW_IF(not digits, config_error{key},
                      "Invalid value '{}' for '{}': expected a "
                      "non-negative integer", value, key);

    long long ret = std::stoll(value);
    ARPGUARD_THROW_IF(ret < min || ret > max, config_error{key},
                      "Value {} for '{}' is out of range [{}, {}]",
                      ret, key, min, max);
    return ret;
}

class Section {
public:
    Section(const Config& root, std::string name)
        : config_(config_cd(root, name)), name_(std::move(name))
    {
        auto it = root.find(name_);
        ARPGUARD_THROW_IF(it != root.end() && not it->second.is_object(),
                          config_error{name_},
                          "Section '{}' must be an object", name_);
    }

    std::string path(const std::string& key) const
    { return name_ + "." + key; }

    const Json* find(const std::string& key) const
    {
        auto it = config_.find(key);
        return it != config_.end() ? &it->second : nullptr;
    }

    [[noreturn]] void invalid(const std::string& key, const Json& value,
                              const char* expected) const
    {
        ARPGUARD_THROW(config_error{path(key)},
                       "Invalid value {} for '{}': expected {}",
                       value.dump(), path(key), expected);
    }

    bool flag(const std::string& key, bool defval) const
    {
        auto v = find(key);
        if (not v)
            return defval;
        if (v->is_bool())
            return v->bool_value();
        if (v->is_string())
            return parse_flag(path(key), v->string_value());
        invalid(key, *v, "a boolean");
    }

    long long integer(const std::string& key, long long defval,
                      long long min, long long max) const
    {
        auto v = find(key);
        if (not v)
            return defval;
        if (v->is_string())
            return parse_integer(path(key), v->string_value(), min, max);
        if (not v->is_number())
            invalid(key, *v, "an integer");

        double d = v->number_value();
        if (d != std::floor(d) || d < double(min) || d > double(max)) {
            ARPGUARD_THROW(config_error{path(key)},
                           "Value {} for '{}' must be an integer in [{}, {}]",
                           v->dump(), path(key), min, max);
        }
        return static_cast<long long>(d);
    }

    std::string string(const std::string& key, const std::string& defval) const
    {
        auto v = find(key);
        if (not v)
            return defval;
        if (not v->is_string())
            invalid(key, *v, "a string");
        return v->string_value();
    }

    BindingList bindings(const std::string& key) const
    {
        BindingList ret;
        auto v = find(key);
        if (not v)
            return ret;
        if (not v->is_object())
            invalid(key, *v, "an object of \"ip\": \"mac\" pairs");

        for (const auto& binding : v->object_items()) {
            const auto& ip = binding.first;
            const auto& mac = binding.second;
            if (not mac.is_string())
                invalid(key, mac, "a MAC address string");
            try {
                ret.emplace_back(IPv4Addr(ip), ethaddr(mac.string_value()));
            } catch (std::domain_error& e) {
                ARPGUARD_THROW(config_error{path(key)},
                               "Invalid binding {} -> {} in '{}': {}",
                               ip, mac.dump(), path(key), e.what());
            }
        }
        return ret;
    }

private:
    Config config_;
    std::string name_;
};

constexpr long long max_int = std::numeric_limits<int>::max();

} // namespace

std::chrono::seconds parse_hold_down(const std::string& key,
                                     const std::string& value)
{
    return std::chrono::seconds(parse_integer(key, value, 0, max_int));
}

Settings read_settings(const Config& config)
{
    Settings ret;

    Section controller{config, "controller"};
    auto& ctl = ret.controller;
    ctl.address = controller.string("address", ctl.address);
    ctl.port = int(controller.integer("port", ctl.port, 1, 65535));
    ctl.nthreads = int(controller.integer("nthreads", ctl.nthreads, 1, 1024));
    ctl.echo_interval = int(controller.integer("echo_interval",
                                               ctl.echo_interval, 1, 3600));
    ctl.liveness_check = controller.flag("liveness_check", ctl.liveness_check);

    Section ls{config, "learning-switch"};
    auto& sw = ret.guard.learning_switch;
    sw.transparent = ls.flag("transparent", sw.transparent);
    sw.hold_down = std::chrono::seconds(
            ls.integer("hold-down", sw.hold_down.count(), 0, max_int));
    sw.halt_on_spoof = ls.flag("halt-on-spoof", sw.halt_on_spoof);

    Section guard{config, "arp-guard"};
    auto timeout = std::chrono::duration_cast<std::chrono::seconds>(
            ret.guard.request_timeout);
    ret.guard.request_timeout = std::chrono::seconds(
            guard.integer("request-timeout", timeout.count(), 1, 3600));
    ret.guard.sweep_interval = std::chrono::milliseconds(
            guard.integer("sweep-interval",
                          ret.guard.sweep_interval.count(), 1, 3600 * 1000));
    ret.bindings = guard.bindings("bindings");

    return ret;
}

} // namespace arpguard
