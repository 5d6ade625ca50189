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

#include <string>
#include <vector>
#include <utility>

#include <boost/thread/mutex.hpp>
#include <boost/thread/lock_guard.hpp>

#include <arpguard/core/logging.hpp>

namespace arpguard {
namespace test {

// Records every glog message sent while the object lives
class LogCapture : public google::LogSink {
public:
    LogCapture()
    { google::AddLogSink(this); }

    ~LogCapture() override
    { google::RemoveLogSink(this); }

    void send(google::LogSeverity severity, const char* /*full_filename*/,
              const char* /*base_filename*/, int /*line*/,
              const struct ::tm* /*tm_time*/,
              const char* message, size_t message_len) override
    {
        boost::lock_guard< boost::mutex > lock(mutex_);
        messages_.emplace_back(severity, std::string(message, message_len));
    }

    size_t count(google::LogSeverity severity, const std::string& text) const
    {
        boost::lock_guard< boost::mutex > lock(mutex_);
        size_t ret = 0;
        for (const auto& m : messages_) {
            if (m.first == severity && m.second.find(text) != std::string::npos)
                ++ret;
        }
        return ret;
    }

private:
    mutable boost::mutex mutex_;
    std::vector< std::pair<google::LogSeverity, std::string> > messages_;
};

} // namespace test
} // namespace arpguard
