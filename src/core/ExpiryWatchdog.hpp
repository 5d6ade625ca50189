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
#include "PendingRequestTracker.hpp"

#include <QTimer>
#include <QThread>

#include <chrono>
#include <memory>

namespace arpguard {

/**
 * Periodically expires stale pending ARP requests.
 *
 * The timer runs on a dedicated thread; the tracker is only touched
 * through its own synchronized interface.
 */
class ExpiryWatchdog {
public:
    explicit ExpiryWatchdog(PendingRequestTracker& requests,
                            std::chrono::milliseconds period
                                = std::chrono::milliseconds(1000),
                            clock::duration max_age
                                = std::chrono::seconds(5));
    ~ExpiryWatchdog();

    void start();
    void stop();
    bool running() const;

    /** One sweep. Returns the number of expired requests. */
    size_t tick(clock::time_point now);

    std::chrono::milliseconds period() const { return period_; }
    clock::duration max_age() const { return max_age_; }

private:
    PendingRequestTracker& requests_;
    std::chrono::milliseconds period_;
    clock::duration max_age_;

    std::unique_ptr<QTimer> wtimer;
    std::unique_ptr<QThread> wthread;
};

} // namespace arpguard
