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

#define BOOST_TEST_MODULE Config tests

#include <cstdio>
#include <fstream>
#include <string>

#include <boost/test/unit_test.hpp>

#include <arpguard/core/exception.hpp>

#include "core/Config.hpp"

using namespace arpguard;
using namespace std::chrono_literals;

namespace {

Config parse(const std::string& text)
{
    std::string err;
    auto json = json11::Json::parse(text, err);
    BOOST_REQUIRE_MESSAGE(err.empty(), err);
    return json.object_items();
}

// Settings file removed at the end of the test
struct TempFile {
    std::string name;

    explicit TempFile(const std::string& content)
        : name("arpguard-config-test.json")
    {
        std::ofstream out(name);
        out << content;
    }

    ~TempFile() { std::remove(name.c_str()); }
};

// Key reported by a config_error
std::string error_key(const Config& config)
{
    try {
        read_settings(config);
    } catch (config_error& e) {
        for (auto& detail : e.with()) {
            if (std::string(detail.first) == "key")
                return detail.second;
        }
        return "<no key>";
    }
    return "<no error>";
}

}

BOOST_AUTO_TEST_SUITE( config_tests )

BOOST_AUTO_TEST_CASE( load_profile ) {
    TempFile file(R"({
        "default": { "controller": { "port": 6633 } },
        "lab":     { "controller": { "port": 6653 } }
    })");

    auto config = loadConfig(file.name);
    BOOST_CHECK_EQUAL(config_cd(config, "controller").at("port").int_value(), 6633);

    config = loadConfig(file.name, "lab");
    BOOST_CHECK_EQUAL(config_cd(config, "controller").at("port").int_value(), 6653);

    BOOST_CHECK_THROW(loadConfig(file.name, "production"), config_error);
}

BOOST_AUTO_TEST_CASE( load_errors ) {
    BOOST_CHECK_THROW(loadConfig("/nonexistent/arpguard-settings.json"),
                      config_error);

    TempFile broken("{ \"default\": ");
    BOOST_CHECK_THROW(loadConfig(broken.name), config_error);
}

BOOST_AUTO_TEST_CASE( change_directory ) {
    auto config = parse(R"({ "arp-guard": { "request-timeout": 3 }, "name": "x" })");
    BOOST_CHECK_EQUAL(config_cd(config, "arp-guard").at("request-timeout").int_value(), 3);
    BOOST_CHECK(config_cd(config, "missing").empty());
    // Not an object
    BOOST_CHECK(config_cd(config, "name").empty());
}

BOOST_AUTO_TEST_CASE( defaults ) {
    auto s = read_settings(Config());
    BOOST_CHECK_EQUAL(s.controller.address, "0.0.0.0");
    BOOST_CHECK_EQUAL(s.controller.port, 6653);
    BOOST_CHECK_EQUAL(s.controller.nthreads, 4);
    BOOST_CHECK(s.controller.liveness_check);
    BOOST_CHECK(not s.guard.learning_switch.transparent);
    BOOST_CHECK(s.guard.learning_switch.hold_down == 0s);
    BOOST_CHECK(not s.guard.learning_switch.halt_on_spoof);
    BOOST_CHECK(s.guard.request_timeout == 5s);
    BOOST_CHECK(s.guard.sweep_interval == 1000ms);
    BOOST_CHECK(s.bindings.empty());
}

BOOST_AUTO_TEST_CASE( full_settings ) {
    auto s = read_settings(parse(R"({
        "controller": {
            "address": "127.0.0.1",
            "port": 6633,
            "nthreads": 2,
            "echo_interval": 5,
            "liveness_check": "off"
        },
        "learning-switch": {
            "transparent": "yes",
            "hold-down": "15",
            "halt-on-spoof": true
        },
        "arp-guard": {
            "request-timeout": 3,
            "sweep-interval": 250,
            "bindings": {
                "10.0.0.1": "00:00:00:00:00:0a",
                "10.0.0.2": "00-00-00-00-00-0b"
            }
        }
    })"));

    BOOST_CHECK_EQUAL(s.controller.address, "127.0.0.1");
    BOOST_CHECK_EQUAL(s.controller.port, 6633);
    BOOST_CHECK_EQUAL(s.controller.nthreads, 2);
    BOOST_CHECK_EQUAL(s.controller.echo_interval, 5);
    BOOST_CHECK(not s.controller.liveness_check);
    BOOST_CHECK(s.guard.learning_switch.transparent);
    BOOST_CHECK(s.guard.learning_switch.hold_down == 15s);
    BOOST_CHECK(s.guard.learning_switch.halt_on_spoof);
    BOOST_CHECK(s.guard.request_timeout == 3s);
    BOOST_CHECK(s.guard.sweep_interval == 250ms);

    BOOST_REQUIRE_EQUAL(s.bindings.size(), 2u);
    BOOST_CHECK_EQUAL(s.bindings[0].first, IPv4Addr("10.0.0.1"));
    BOOST_CHECK_EQUAL(s.bindings[0].second, ethaddr("00:00:00:00:00:0a"));
    BOOST_CHECK_EQUAL(s.bindings[1].second, ethaddr("00:00:00:00:00:0b"));
}

BOOST_AUTO_TEST_CASE( invalid_hold_down ) {
    BOOST_CHECK_EQUAL(error_key(parse(R"({"learning-switch": {"hold-down": -1}})")),
                      "learning-switch.hold-down");
    BOOST_CHECK_EQUAL(error_key(parse(R"({"learning-switch": {"hold-down": "-1"}})")),
                      "learning-switch.hold-down");
    BOOST_CHECK_EQUAL(error_key(parse(R"({"learning-switch": {"hold-down": "ten"}})")),
                      "learning-switch.hold-down");
    BOOST_CHECK_EQUAL(error_key(parse(R"({"learning-switch": {"hold-down": 1.5}})")),
                      "learning-switch.hold-down");
    BOOST_CHECK_EQUAL(error_key(parse(R"({"learning-switch": {"hold-down": ""}})")),
                      "learning-switch.hold-down");
    BOOST_CHECK_EQUAL(error_key(parse(R"({"learning-switch": {"hold-down": [3]}})")),
                      "learning-switch.hold-down");
}

BOOST_AUTO_TEST_CASE( invalid_values ) {
    BOOST_CHECK_EQUAL(error_key(parse(R"({"learning-switch": {"transparent": "maybe"}})")),
                      "learning-switch.transparent");
    BOOST_CHECK_EQUAL(error_key(parse(R"({"learning-switch": {"transparent": 1}})")),
                      "learning-switch.transparent");
    BOOST_CHECK_EQUAL(error_key(parse(R"({"controller": {"port": 0}})")),
                      "controller.port");
    BOOST_CHECK_EQUAL(error_key(parse(R"({"controller": {"port": 70000}})")),
                      "controller.port");
    BOOST_CHECK_EQUAL(error_key(parse(R"({"controller": {"address": 1}})")),
                      "controller.address");
    BOOST_CHECK_EQUAL(error_key(parse(R"({"arp-guard": {"request-timeout": 0}})")),
                      "arp-guard.request-timeout");
    BOOST_CHECK_EQUAL(error_key(parse(R"({"arp-guard": {"bindings": {"10.0.0.300": "00:00:00:00:00:01"}}})")),
                      "arp-guard.bindings");
    BOOST_CHECK_EQUAL(error_key(parse(R"({"arp-guard": {"bindings": {"10.0.0.1": "nope"}}})")),
                      "arp-guard.bindings");
    BOOST_CHECK_EQUAL(error_key(parse(R"({"arp-guard": {"bindings": {"10.0.0.1": 5}}})")),
                      "arp-guard.bindings");
    BOOST_CHECK_EQUAL(error_key(parse(R"({"learning-switch": true})")),
                      "learning-switch");
}

BOOST_AUTO_TEST_CASE( flags ) {
    for (auto v : {"true", "TRUE", "yes", "On", "1"})
        BOOST_CHECK(parse_flag("transparent", v));
    for (auto v : {"false", "No", "off", "0"})
        BOOST_CHECK(not parse_flag("transparent", v));
    BOOST_CHECK_THROW(parse_flag("transparent", ""), config_error);
    BOOST_CHECK_THROW(parse_flag("transparent", "2"), config_error);
}

BOOST_AUTO_TEST_CASE( hold_down_option ) {
    BOOST_CHECK(parse_hold_down("hold-down", "0") == 0s);
    BOOST_CHECK(parse_hold_down("hold-down", "30") == 30s);
    BOOST_CHECK_THROW(parse_hold_down("hold-down", "-3"), config_error);
    BOOST_CHECK_THROW(parse_hold_down("hold-down", "3s"), config_error);
    BOOST_CHECK_THROW(parse_hold_down("hold-down", " 3"), config_error);
    BOOST_CHECK_THROW(parse_hold_down("hold-down", "99999999999"), config_error);
}

BOOST_AUTO_TEST_SUITE_END()
