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

#include "ArpValidator.hpp"

#include <arpguard/core/throw.hpp>

#include <utility>

namespace arpguard {

using Check = AddressBindingTable::Check;

const char* to_string(SpoofReason reason)
{
    switch (reason) {
    case SpoofReason::EthArpSrcMismatch:
        return "eth/arp src mismatch";
    case SpoofReason::UnknownSourceBinding:
        return "unknown source binding";
    case SpoofReason::SourceBindingMismatch:
        return "source binding mismatch";
    case SpoofReason::UnknownDestination:
        return "unknown destination";
    case SpoofReason::EthArpDstMismatch:
        return "eth/arp dst mismatch";
    case SpoofReason::UnknownDestinationBinding:
        return "unknown destination binding";
    case SpoofReason::DestinationBindingMismatch:
        return "destination binding mismatch";
    case SpoofReason::BroadcastReply:
        return "broadcast reply";
    case SpoofReason::NoOutstandingRequest:
        return "no matching outstanding request";
    }
    return "unknown reason";
}

std::ostream& operator<<(std::ostream& out, SpoofReason reason)
{
    return out << to_string(reason);
}

Verdict Verdict::spoof(std::vector<SpoofReason> reasons,
                       Disposition disposition)
{
    ARPGUARD_THROW_IF(reasons.empty(), invalid_argument{},
                      "Spoof verdict without a reason");
    Verdict ret;
    ret.reasons_ = std::move(reasons);
    ret.disposition_ = disposition;
    return ret;
}

SpoofReason Verdict::reason() const
{
    ARPGUARD_THROW_IF(reasons_.empty(), invalid_argument{},
                      "Valid verdict has no spoof reason");
    return reasons_.front();
}

std::ostream& operator<<(std::ostream& out, const Verdict& verdict)
{
    if (verdict.is_valid())
        return out << "VALID";

    out << "SPOOF(";
    const char* sep = "";
    for (auto reason : verdict.reasons()) {
        out << sep << reason;
        sep = ", ";
    }
    return out << ')';
}

Verdict ArpValidator::validate(const PacketInfo& pkt, clock::time_point now)
{
    if (not pkt.arp)
        return Verdict::valid();

    switch (pkt.arp->opcode) {
    case arp_op::request:
        return validate_request(pkt, *pkt.arp, now);
    case arp_op::reply:
        return validate_reply(pkt, *pkt.arp, now);
    default:
        return Verdict::valid();
    }
}

Verdict ArpValidator::validate_request(const PacketInfo& pkt,
                                       const ArpHeader& arp,
                                       clock::time_point now)
{
    if (pkt.eth_src != arp.sha) {
        return Verdict::spoof({SpoofReason::EthArpSrcMismatch}, Verdict::Halt);
    }

    switch (bindings_.check(arp.spa, arp.sha)) {
    case Check::Unknown:
        return Verdict::spoof({SpoofReason::UnknownSourceBinding},
                              Verdict::Continue);
    case Check::Mismatch:
        return Verdict::spoof({SpoofReason::SourceBindingMismatch},
                              Verdict::Continue);
    case Check::Match:
        break;
    }

    if (not bindings_.lookup(arp.tpa)) {
        return Verdict::spoof({SpoofReason::UnknownDestination},
                              Verdict::Continue);
    }

    requests_.record(arp.spa, arp.tpa, now);
    return Verdict::valid();
}

Verdict ArpValidator::validate_reply(const PacketInfo& pkt,
                                     const ArpHeader& arp,
                                     clock::time_point now)
{
    std::vector<SpoofReason> reasons;

    if (pkt.eth_src != arp.sha)
        reasons.push_back(SpoofReason::EthArpSrcMismatch);
    if (pkt.eth_dst != arp.tha)
        reasons.push_back(SpoofReason::EthArpDstMismatch);

    switch (bindings_.check(arp.spa, arp.sha)) {
    case Check::Unknown:
        reasons.push_back(SpoofReason::UnknownSourceBinding);
        break;
    case Check::Mismatch:
        reasons.push_back(SpoofReason::SourceBindingMismatch);
        break;
    case Check::Match:
        break;
    }

    switch (bindings_.check(arp.tpa, arp.tha)) {
    case Check::Unknown:
        reasons.push_back(SpoofReason::UnknownDestinationBinding);
        break;
    case Check::Mismatch:
        reasons.push_back(SpoofReason::DestinationBindingMismatch);
        break;
    case Check::Match:
        break;
    }

    if (is_broadcast(pkt.eth_dst))
        reasons.push_back(SpoofReason::BroadcastReply);

    // The request went the other way: its sender is our target.
    // A reply consumes the request only if nothing else is wrong with it.
    bool outstanding = reasons.empty()
        ? requests_.resolve(arp.tpa, arp.spa, now)
        : bool(requests_.is_pending(arp.tpa, arp.spa));

    if (not outstanding) {
        reasons.push_back(SpoofReason::NoOutstandingRequest);
        return Verdict::spoof(std::move(reasons), Verdict::Halt);
    }

    if (not reasons.empty())
        return Verdict::spoof(std::move(reasons), Verdict::Continue);

    return Verdict::valid();
}

} // namespace arpguard
