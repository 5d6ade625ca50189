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
#include "Config.hpp"
#include "Controller.hpp"

#include <arpguard/core/logging.hpp>
#include <arpguard/core/catch_all.hpp>

#include <QCoreApplication>

#include <cxxopts.hpp>

#include <cstdlib>
#include <iostream>

namespace arpguard {

class ArpGuardApplication : public QCoreApplication
{
public:
    ArpGuardApplication(int &argc, char *argv[])
        : QCoreApplication(argc, argv)
    { }

    bool notify( QObject * receiver, QEvent * event ) override
    {
        bool ret = false;
        catch_all_and_log([&]() {
            ret = QCoreApplication::notify(receiver, event);
        });
        return ret;
    }
};

} // namespace arpguard

#include <signal.h>

int main(int argc, char* argv[]) {
    using namespace arpguard;

    signal(SIGPIPE, SIG_IGN);

    cxxopts::Options options(argv[0], " - ARP spoofing aware L2 learning switch");

    options.add_options()
        ("c,conf", "Path to settings file", cxxopts::value<std::string>()
            ->default_value("arpguard-settings.json"))
        ("p,profile", "Settings profile", cxxopts::value<std::string>()
            ->default_value("default"))
        ("transparent", "Forward link-local and bridge-filtered frames",
            cxxopts::value<std::string>()->implicit_value("true"))
        ("hold-down", "Seconds to hold down flooding after a switch connects",
            cxxopts::value<std::string>())
        ("help", "Print this")
    ;

    try {
        options.parse(argc, argv);
    } catch (cxxopts::OptionException& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    if (options.count("help")) {
        std::cout << options.help({""}) << std::endl;
        return 0;
    }

    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();

    ArpGuardApplication app(argc, argv);

    Settings settings;
    try {
        Config config = loadConfig(options["conf"].as<std::string>(),
                                   options["profile"].as<std::string>());
        settings = read_settings(config);

        auto& sw = settings.guard.learning_switch;
        if (options.count("transparent")) {
            sw.transparent = parse_flag("transparent",
                    options["transparent"].as<std::string>());
        }
        if (options.count("hold-down")) {
            sw.hold_down = parse_hold_down("hold-down",
                    options["hold-down"].as<std::string>());
        }
    } catch (config_error& e) {
        diagnostic_information{e}.log();
        LOG(ERROR) << "Invalid configuration, exiting";
        return EXIT_FAILURE;
    }

    const auto& sw = settings.guard.learning_switch;
    LOG(INFO) << "Starting: transparent=" << std::boolalpha << sw.transparent
              << " hold-down=" << sw.hold_down.count() << "s"
              << " halt-on-spoof=" << sw.halt_on_spoof
              << " bindings=" << settings.bindings.size();

    ArpGuard guard{settings.guard};
    for (const auto& binding : settings.bindings) {
        guard.address_leased(binding.first, binding.second);
    }

    Controller controller{guard, settings.controller};
    guard.start();
    controller.start();

    int ret = app.exec();

    controller.stop();
    guard.stop();
    return ret;
}
