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

#include "types/ethaddr.hh"
#include "types/IPv4Addr.hh"

#include <boost/thread/shared_mutex.hpp>

#include <optional>
#include <unordered_map>

namespace arpguard {

/**
 * Process-wide IP to MAC registry fed by address lease events.
 *
 * One binding per IP, last write wins, no expiry. Thread-safe.
 */
class AddressBindingTable {
public:
    enum class Check { Match, Mismatch, Unknown };

    /** Upserts the binding of `ip`. */
    void assign(IPv4Addr ip, ethaddr mac);

    std::optional<ethaddr> lookup(IPv4Addr ip) const;

    /** Looks `ip` up and compares the binding with `mac` under one lock. */
    Check check(IPv4Addr ip, ethaddr mac) const;

    size_t size() const;

private:
    mutable boost::shared_mutex mutex_;
    std::unordered_map<IPv4Addr, ethaddr> bindings_;
};

} // namespace arpguard
