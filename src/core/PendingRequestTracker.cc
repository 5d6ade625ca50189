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

#include "PendingRequestTracker.hpp"

#include <boost/functional/hash.hpp>
#include <boost/thread/lock_guard.hpp>

namespace arpguard {

using lock_t = boost::lock_guard<boost::mutex>;

std::ostream& operator<<(std::ostream& out, RequestState::Kind kind)
{
    switch (kind) {
    case RequestState::Pending:  return out << "pending";
    case RequestState::Answered: return out << "answered";
    case RequestState::Expired:  return out << "expired";
    }
    return out << "unknown";
}

size_t PendingRequestTracker::key_hash::operator()(const key_type& key)
    const noexcept
{
    size_t seed = 0;
    boost::hash_combine(seed, key.first.to_number());
    boost::hash_combine(seed, key.second.to_number());
    return seed;
}

void PendingRequestTracker::record(IPv4Addr src, IPv4Addr dst,
                                   clock::time_point now)
{
    lock_t lock(mutex_);
    requests_[key_type(src, dst)] = RequestState{RequestState::Pending, now};
}

void PendingRequestTracker::clear(IPv4Addr src, IPv4Addr dst,
                                  clock::time_point now)
{
    lock_t lock(mutex_);
    auto it = requests_.find(key_type(src, dst));
    if (it != requests_.end()) {
        it->second = RequestState{RequestState::Answered, now};
    }
}

std::optional<clock::time_point>
PendingRequestTracker::is_pending(IPv4Addr src, IPv4Addr dst) const
{
    lock_t lock(mutex_);
    auto it = requests_.find(key_type(src, dst));
    if (it == requests_.end() || it->second.kind != RequestState::Pending)
        return std::nullopt;
    return it->second.at;
}

std::optional<RequestState>
PendingRequestTracker::state(IPv4Addr src, IPv4Addr dst) const
{
    lock_t lock(mutex_);
    auto it = requests_.find(key_type(src, dst));
    if (it == requests_.end())
        return std::nullopt;
    return it->second;
}

bool PendingRequestTracker::resolve(IPv4Addr src, IPv4Addr dst,
                                    clock::time_point now)
{
    lock_t lock(mutex_);
    auto it = requests_.find(key_type(src, dst));
    if (it == requests_.end() || it->second.kind != RequestState::Pending)
        return false;
    it->second = RequestState{RequestState::Answered, now};
    return true;
}

size_t PendingRequestTracker::sweep(clock::time_point now,
                                    clock::duration max_age)
{
    lock_t lock(mutex_);
    size_t expired = 0;
    for (auto& entry : requests_) {
        auto& state = entry.second;
        if (state.kind == RequestState::Pending && now - state.at > max_age) {
            state = RequestState{RequestState::Expired, now};
            ++expired;
        }
    }
    return expired;
}

} // namespace arpguard
