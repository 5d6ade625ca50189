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
#include "types/IPv4Addr.hh"

#include <boost/thread/mutex.hpp>

#include <chrono>
#include <optional>
#include <ostream>
#include <unordered_map>
#include <utility>

namespace arpguard {

/**
 * State of an ARP request seen for a (sender IP, target IP) pair.
 */
struct RequestState {
    enum Kind { Pending, Answered, Expired };

    Kind kind;
    // Pending: when the request was recorded.
    // Answered, Expired: when the entry left the Pending state.
    clock::time_point at;
};

std::ostream& operator<<(std::ostream& out, RequestState::Kind kind);

/**
 * Outstanding ARP requests keyed by (sender IP, target IP).
 *
 * At most one Pending value per key; a later request overwrites the
 * timestamp. Every operation is atomic with respect to the others.
 */
class PendingRequestTracker {
public:
    using key_type = std::pair<IPv4Addr, IPv4Addr>;

    void record(IPv4Addr src, IPv4Addr dst, clock::time_point now);

    /** Marks the pair as answered if it was known. */
    void clear(IPv4Addr src, IPv4Addr dst,
               clock::time_point now = clock::now());

    /** Timestamp of the pending request, empty if there is none. */
    std::optional<clock::time_point> is_pending(IPv4Addr src,
                                                IPv4Addr dst) const;

    /** Empty optional if the pair has never been recorded. */
    std::optional<RequestState> state(IPv4Addr src, IPv4Addr dst) const;

    /**
     * Marks a Pending entry as Answered.
     * @return false if there was no Pending entry for the pair.
     */
    bool resolve(IPv4Addr src, IPv4Addr dst, clock::time_point now);

    /**
     * Expires every Pending entry older than `max_age`.
     * @return number of expired entries.
     */
    size_t sweep(clock::time_point now,
                 clock::duration max_age = std::chrono::seconds(5));

private:
    struct key_hash {
        size_t operator()(const key_type& key) const noexcept;
    };

    mutable boost::mutex mutex_;
    std::unordered_map<key_type, RequestState, key_hash> requests_;
};

} // namespace arpguard
