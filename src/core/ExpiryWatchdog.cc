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

#include "ExpiryWatchdog.hpp"

#include <arpguard/core/logging.hpp>
#include <arpguard/core/catch_all.hpp>

namespace arpguard {

ExpiryWatchdog::ExpiryWatchdog(PendingRequestTracker& requests,
                               std::chrono::milliseconds period,
                               clock::duration max_age)
    : requests_(requests)
    , period_(period)
    , max_age_(max_age)
    , wtimer(new QTimer)
    , wthread(new QThread)
{
    wtimer->setInterval(int(period.count()));
    wtimer->moveToThread(wthread.get());

    QObject::connect(wthread.get(), &QThread::started,
                     wtimer.get(), qOverload<>(&QTimer::start));
    QObject::connect(wthread.get(), &QThread::finished,
                     wtimer.get(), &QTimer::stop);
    QObject::connect(wtimer.get(), &QTimer::timeout, wtimer.get(), [this]() {
        catch_all_and_log([this]() { tick(clock::now()); });
    }, Qt::DirectConnection);
}

ExpiryWatchdog::~ExpiryWatchdog()
{
    stop();
}

void ExpiryWatchdog::start()
{
    if (wthread->isRunning())
        return;

    LOG(INFO) << "[ExpiryWatchdog] Sweeping pending ARP requests every "
              << period_.count() << " ms, max age "
              << std::chrono::duration_cast<std::chrono::milliseconds>(
                     max_age_).count() << " ms";
    wthread->start();
}

void ExpiryWatchdog::stop()
{
    if (not wthread->isRunning())
        return;

    wthread->quit();
    wthread->wait();
}

bool ExpiryWatchdog::running() const
{
    return wthread->isRunning();
}

size_t ExpiryWatchdog::tick(clock::time_point now)
{
    size_t expired = requests_.sweep(now, max_age_);
    if (expired > 0) {
        VLOG(2) << "[ExpiryWatchdog] Expired " << expired
                << " pending ARP request(s)";
    }
    return expired;
}

} // namespace arpguard
