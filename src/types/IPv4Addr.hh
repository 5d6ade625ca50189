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

#pragma once

#include <cstdint>
#include <array>
#include <functional>  // for hash
#include <iosfwd>
#include <string>
#include <stdexcept>

namespace arpguard {class IPv4Addr;}

namespace std{
template<>
struct hash<arpguard::IPv4Addr>{
    size_t operator()(const arpguard::IPv4Addr& addr) const noexcept;
};
}//namespace std

namespace arpguard {

class IPv4Addr{
public:
    static constexpr size_t             nbits = 32;
    static constexpr size_t             nbytes = 4;
    typedef std::array<uint8_t, nbytes> bytes_type;

    struct bad_representation : std::domain_error {
        using std::domain_error::domain_error;
    };

    //all octets zero addr
    IPv4Addr() = default;

    //from dotted-quad string
    IPv4Addr(const std::string &str);
    IPv4Addr(const char* str)
        : IPv4Addr(std::string(str))
    { }

    //from octets in network byte order
    IPv4Addr(const bytes_type &octets) noexcept;

    // Construct IPv4 Address from host-order number, 0x0a000001 -> 10.0.0.1
    explicit IPv4Addr(uint32_t num) noexcept
        : data_(num)
    { }

    bytes_type to_octets() const noexcept;

    uint32_t to_number() const noexcept
    { return data_; }

    std::string to_string() const;

    friend bool operator==(const IPv4Addr& lhs, const IPv4Addr& rhs) noexcept
    { return lhs.data_ == rhs.data_; }

    friend bool operator!=(const IPv4Addr& lhs, const IPv4Addr&rhs) noexcept
    { return lhs.data_ != rhs.data_; }

    friend bool operator<(const IPv4Addr& lhs, const IPv4Addr&rhs) noexcept
    { return lhs.data_ < rhs.data_; }

    friend bool is_loopback(const IPv4Addr&) noexcept;
    friend bool is_multicast(const IPv4Addr&) noexcept;
    friend bool is_broadcast(const IPv4Addr&) noexcept;
    friend bool is_unspecified(const IPv4Addr&) noexcept;

    friend std::ostream& operator<<(std::ostream&, const IPv4Addr&);

private:
    uint32_t data_ {0};
};

bool is_loopback(const IPv4Addr&) noexcept;
bool is_multicast(const IPv4Addr&) noexcept;
bool is_broadcast(const IPv4Addr&) noexcept;
bool is_unspecified(const IPv4Addr&) noexcept;

}//namespace arpguard
