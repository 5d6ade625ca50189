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
#include "PacketParser.hpp"
#include "AddressBindingTable.hpp"
#include "PendingRequestTracker.hpp"

#include <ostream>
#include <vector>

namespace arpguard {

enum class SpoofReason {
    EthArpSrcMismatch,
    UnknownSourceBinding,
    SourceBindingMismatch,
    UnknownDestination,
    EthArpDstMismatch,
    UnknownDestinationBinding,
    DestinationBindingMismatch,
    BroadcastReply,
    NoOutstandingRequest
};

const char* to_string(SpoofReason reason);
std::ostream& operator<<(std::ostream& out, SpoofReason reason);

/**
 * Outcome of validating one ARP packet.
 */
class Verdict {
public:
    enum Disposition {
        // Keep processing the packet after the drop rule
        Continue,
        // Stop processing the packet
        Halt
    };

    static Verdict valid()
    { return Verdict{}; }

    static Verdict spoof(std::vector<SpoofReason> reasons,
                         Disposition disposition);

    bool is_valid() const { return reasons_.empty(); }
    bool is_spoof() const { return not reasons_.empty(); }

    /** First failed check. Throws invalid_argument on a valid verdict. */
    SpoofReason reason() const;

    /** Every failed check in evaluation order. */
    const std::vector<SpoofReason>& reasons() const { return reasons_; }

    Disposition disposition() const { return disposition_; }

private:
    Verdict() = default;

    std::vector<SpoofReason> reasons_;
    Disposition disposition_ {Continue};
};

std::ostream& operator<<(std::ostream& out, const Verdict& verdict);

/**
 * Classifies ARP packets as valid or spoofed against the address bindings
 * and the outstanding requests.
 *
 * A valid request is recorded as pending; a valid reply answers the
 * pending request in the reverse direction. Thread-safe as long as the
 * registries are.
 */
class ArpValidator {
public:
    ArpValidator(const AddressBindingTable& bindings,
                 PendingRequestTracker& requests)
        : bindings_(bindings), requests_(requests)
    { }

    /**
     * Packets without an ARP header and ARP opcodes other than request
     * and reply are valid and leave the registries untouched.
     */
    Verdict validate(const PacketInfo& pkt, clock::time_point now);

private:
    Verdict validate_request(const PacketInfo& pkt, const ArpHeader& arp,
                             clock::time_point now);
    Verdict validate_reply(const PacketInfo& pkt, const ArpHeader& arp,
                           clock::time_point now);

    const AddressBindingTable& bindings_;
    PendingRequestTracker& requests_;
};

} // namespace arpguard
