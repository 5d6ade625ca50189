/*
 * Copyright 2015 Applied Research Center for Computer Networks
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

#include "IPv4Addr.hh"

#include <ostream>
#include <regex>
#include <boost/format.hpp>

namespace arpguard {

static uint32_t parseIPv4Address(const std::string &str)
{
    static const std::string ipv4_pattern =
        "([[:digit:]]{1,3})\\.([[:digit:]]{1,3})\\."
        "([[:digit:]]{1,3})\\.([[:digit:]]{1,3})";

    static const auto ipv4_regex =
        std::regex(ipv4_pattern, std::regex::optimize);

    std::smatch match;

    if (not std::regex_match(str, match, ipv4_regex)) {
        throw IPv4Addr::bad_representation("Bad IPv4 address: " + str);
    }

    uint32_t res = 0;
    for (size_t oct = 1; oct <= 4; ++oct) {
        int value = std::stoi(match[oct], 0, 10);
        if (value > 255) {
            throw IPv4Addr::bad_representation("Bad IPv4 address: " + str);
        }
        res = (res << 8) | (uint8_t) value;
    }

    return res;
}

static bool compare_prefix(uint32_t prefix, uint32_t value, uint8_t len)
{
    uint8_t shift = 32 - len;
    return (prefix >> shift) == (value >> shift);
}

IPv4Addr::IPv4Addr(const std::string &str)
    : data_(parseIPv4Address(str))
{ }

IPv4Addr::IPv4Addr(const bytes_type &octets) noexcept
    :data_( ((uint32_t) octets[0] << 24U) |
            ((uint32_t) octets[1] << 16U) |
            ((uint32_t) octets[2] << 8U ) |
            ((uint32_t) octets[3]) )
{ }

IPv4Addr::bytes_type IPv4Addr::to_octets() const noexcept
{
    return bytes_type{{
        (uint8_t) ((data_ & 0xff000000U) >> 24U),
        (uint8_t) ((data_ & 0xff0000U)   >> 16U),
        (uint8_t) ((data_ & 0xff00U)     >> 8U ),
        (uint8_t) ((data_ & 0xffU)             ),
    }};
}

std::string IPv4Addr::to_string() const
{
    const auto data = to_octets();
    return boost::str(boost::format("%u.%u.%u.%u")
        % unsigned(data[0]) % unsigned(data[1])
        % unsigned(data[2]) % unsigned(data[3]));
}

std::ostream& operator<<(std::ostream &out, const IPv4Addr &ipv4)
{
    return out << ipv4.to_string();
}

bool is_loopback(const IPv4Addr &addr) noexcept
{
    return compare_prefix(0x7f000000U, addr.data_, 8);
}

bool is_multicast(const IPv4Addr &addr) noexcept
{
    return compare_prefix(0xe0000000U, addr.data_, 4);
}

bool is_broadcast(const IPv4Addr &addr) noexcept
{
    return addr.data_ == 0xffffffffU;
}

bool is_unspecified(const IPv4Addr &addr) noexcept
{
    return addr.data_ == 0;
}

}// namespace arpguard

using arpguard::IPv4Addr;
size_t std::hash<IPv4Addr>::operator()(const IPv4Addr& addr) const noexcept
{
    return std::hash<uint32_t>()(addr.to_number());
}
