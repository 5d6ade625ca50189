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

#include "AddressBindingTable.hpp"

#include <boost/thread/locks.hpp>

namespace arpguard {

void AddressBindingTable::assign(IPv4Addr ip, ethaddr mac)
{
    boost::unique_lock< boost::shared_mutex > lock(mutex_);
    bindings_[ip] = mac;
}

std::optional<ethaddr> AddressBindingTable::lookup(IPv4Addr ip) const
{
    boost::shared_lock< boost::shared_mutex > lock(mutex_);
    auto it = bindings_.find(ip);
    if (it == bindings_.end())
        return std::nullopt;
    return it->second;
}

AddressBindingTable::Check
AddressBindingTable::check(IPv4Addr ip, ethaddr mac) const
{
    boost::shared_lock< boost::shared_mutex > lock(mutex_);
    auto it = bindings_.find(ip);
    if (it == bindings_.end())
        return Check::Unknown;
    return it->second == mac ? Check::Match : Check::Mismatch;
}

size_t AddressBindingTable::size() const
{
    boost::shared_lock< boost::shared_mutex > lock(mutex_);
    return bindings_.size();
}

} // namespace arpguard
