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

#include "Controller.hpp"

#include <arpguard/core/logging.hpp>
#include <arpguard/core/catch_all.hpp>

#include <fluid/OFServer.hh>
#include <fluid/OFConnection.hh>
#include <fluid/of13msg.hh>

#include <boost/thread/locks.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/shared_mutex.hpp>

#include <cstdint>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

namespace arpguard {

typedef fluid_base::OFConnection FluidConnection;
namespace of13 = fluid_msg::of13;

namespace {

struct fluid_conn_data {
    uint64_t dpid;

    static fluid_conn_data* get(FluidConnection* conn)
    {
        return reinterpret_cast<fluid_conn_data*>
            (conn->get_application_data());
    }
};

void add_match(of13::FlowMod& fm, const FlowMatch& m)
{
    auto eth_type = m.eth_type;
    if (not eth_type) {
        // OXM prerequisites
        if (m.ip_src || m.ip_dst || m.ip_proto)
            eth_type = ethertype::ipv4;
        else if (m.arp_op || m.arp_spa || m.arp_tpa)
            eth_type = ethertype::arp;
    }

    if (m.in_port)
        fm.add_oxm_field(new of13::InPort(*m.in_port));
    if (m.eth_dst)
        fm.add_oxm_field(new of13::EthDst(
                    fluid_msg::EthAddress(m.eth_dst->to_string())));
    if (m.eth_src)
        fm.add_oxm_field(new of13::EthSrc(
                    fluid_msg::EthAddress(m.eth_src->to_string())));
    if (eth_type)
        fm.add_oxm_field(new of13::EthType(*eth_type));
    if (m.vlan_id)
        fm.add_oxm_field(new of13::VLANVid(*m.vlan_id | of13::OFPVID_PRESENT));

    if (m.ip_proto)
        fm.add_oxm_field(new of13::IPProto(*m.ip_proto));
    if (m.ip_src)
        fm.add_oxm_field(new of13::IPv4Src(
                    fluid_msg::IPAddress(m.ip_src->to_string())));
    if (m.ip_dst)
        fm.add_oxm_field(new of13::IPv4Dst(
                    fluid_msg::IPAddress(m.ip_dst->to_string())));

    // Transport ports need a known protocol
    if (m.ip_proto == ipproto::tcp) {
        if (m.tp_src)
            fm.add_oxm_field(new of13::TCPSrc(*m.tp_src));
        if (m.tp_dst)
            fm.add_oxm_field(new of13::TCPDst(*m.tp_dst));
    } else if (m.ip_proto == ipproto::udp) {
        if (m.tp_src)
            fm.add_oxm_field(new of13::UDPSrc(*m.tp_src));
        if (m.tp_dst)
            fm.add_oxm_field(new of13::UDPDst(*m.tp_dst));
    }

    if (m.arp_op)
        fm.add_oxm_field(new of13::ARPOp(*m.arp_op));
    if (m.arp_spa)
        fm.add_oxm_field(new of13::ARPSPA(
                    fluid_msg::IPAddress(m.arp_spa->to_string())));
    if (m.arp_tpa)
        fm.add_oxm_field(new of13::ARPTPA(
                    fluid_msg::IPAddress(m.arp_tpa->to_string())));
}

of13::FlowMod make_flow_mod(const FlowRule& rule)
{
    of13::FlowMod fm;
    fm.command(of13::OFPFC_ADD);
    fm.table_id(0);
    fm.cookie(0);
    fm.priority(rule.priority);
    fm.idle_timeout(rule.idle_timeout.count());
    fm.hard_timeout(rule.hard_timeout.count());
    fm.buffer_id(rule.buffer_id ? *rule.buffer_id : OFP_NO_BUFFER);
    fm.out_port(of13::OFPP_ANY);
    fm.out_group(of13::OFPG_ANY);
    add_match(fm, rule.match);

    // No instructions drop the matching packets
    if (not rule.out_ports.empty()) {
        of13::ApplyActions act;
        for (uint32_t port : rule.out_ports) {
            of13::OutputAction out(port, of13::OFPCML_NO_BUFFER);
            act.add_action(out);
        }
        fm.add_instruction(act);
    }

    return fm;
}

of13::PacketOut make_packet_out(const PacketOut& po)
{
    of13::PacketOut out;
    out.buffer_id(po.buffer_id ? *po.buffer_id : OFP_NO_BUFFER);
    out.in_port(po.in_port);
    if (not po.buffer_id && not po.data.empty()) {
        out.data(const_cast<uint8_t*>(po.data.data()), po.data.size());
    }
    for (uint32_t port : po.out_ports) {
        of13::OutputAction action(port, of13::OFPCML_NO_BUFFER);
        out.add_action(action);
    }
    return out;
}

} // namespace

/**
 * SwitchConnection over a libfluid connection.
 *
 * Detached when the switch goes away; later requests are logged and dropped.
 */
class OFSwitchConnection final : public SwitchConnection {
public:
    OFSwitchConnection(FluidConnection* conn, uint64_t dpid,
                       clock::time_point since)
        : conn_(conn), dpid_(dpid), since_(since)
    { }

    uint64_t dpid() const override
    { return dpid_; }

    clock::time_point connected_since() const override
    { return since_; }

    void install(const FlowRule& rule) override
    {
        VLOG(6) << "[Controller] dpid=" << dpid_ << " flow-mod " << rule;
        auto fm = make_flow_mod(rule);
        send(fm);
    }

    void send(const PacketOut& po) override
    {
        VLOG(6) << "[Controller] dpid=" << dpid_ << " packet-out " << po;
        auto out = make_packet_out(po);
        send(out);
    }

    void send(fluid_msg::OFMsg& msg)
    {
        boost::lock_guard<boost::mutex> lock(mutex_);
        if (not conn_ || not conn_->is_alive()) {
            LOG(WARNING) << "[Controller] Switch dpid=" << dpid_
                         << " is not connected, message type="
                         << unsigned(msg.type()) << " dropped";
            return;
        }

        auto deleter = &fluid_msg::OFMsg::free_buffer;
        std::unique_ptr<uint8_t[], decltype(deleter)> buf
            { msg.pack(), deleter };
        conn_->send(buf.get(), msg.length());
    }

    /** Clears the flow table and sends table misses to the controller. */
    void reset_table()
    {
        of13::FlowMod clear;
        clear.command(of13::OFPFC_DELETE);
        clear.table_id(of13::OFPTT_ALL);
        clear.cookie(0x0);
        clear.cookie_mask(0x0);
        clear.out_port(of13::OFPP_ANY);
        clear.out_group(of13::OFPG_ANY);
        send(clear);

        FlowRule miss;
        miss.priority = priority::table_miss;
        miss.out_ports = {port::controller};
        install(miss);
    }

    FluidConnection* fluid_conn() const
    {
        boost::lock_guard<boost::mutex> lock(mutex_);
        return conn_;
    }

    void detach()
    {
        boost::lock_guard<boost::mutex> lock(mutex_);
        conn_ = nullptr;
    }

private:
    mutable boost::mutex mutex_;
    FluidConnection* conn_;
    const uint64_t dpid_;
    const clock::time_point since_;
};

typedef std::shared_ptr<OFSwitchConnection> OFSwitchConnectionPtr;

struct Controller::implementation : fluid_base::OFServer
{
    ArpGuard& guard;

    mutable boost::shared_mutex connections_mutex;
    std::unordered_map<uint64_t, OFSwitchConnectionPtr> connections;

    implementation(ArpGuard& guard, const ControllerSettings& settings)
        : fluid_base::OFServer(settings.address.c_str(),
                               settings.port,
                               settings.nthreads,
                               /* secure: */ false,
                               fluid_base::OFServerSettings()
                                    .supported_version(of13::OFP_VERSION)
                                    .keep_data_ownership(false)
                                    .echo_interval(settings.echo_interval)
                                    .liveness_check(settings.liveness_check))
        , guard(guard)
    { }

    void message_callback(FluidConnection* conn, uint8_t type,
                          void* data, size_t len) override;

    void connection_callback(FluidConnection* conn,
                             FluidConnection::Event type) override;

    void features_reply(FluidConnection* conn, uint8_t* data);
    void packet_in(FluidConnection* conn, uint64_t dpid, uint8_t* data,
                   clock::time_point arrival);
    void error(uint64_t dpid, uint8_t* data);
    void connection_lost(FluidConnection* conn);
};

void Controller::implementation::message_callback(FluidConnection* conn,
                                                  uint8_t type,
                                                  void* data_,
                                                  size_t len)
{ catch_all_and_log([&]() {
    auto arrival = clock::now();
    auto deleter = [this](void* ptr){ free_data(ptr); };
    std::unique_ptr<void, decltype(deleter)> data {data_, deleter};
    auto bytes = static_cast<uint8_t*>(data_);

    if (type == of13::OFPT_FEATURES_REPLY) {
        features_reply(conn, bytes);
        return;
    }

    auto conn_data = fluid_conn_data::get(conn);
    if (not conn_data) {
        LOG(WARNING) << "[Controller] Connection id=" << conn->get_id()
                     << " sent message type=" << unsigned(type)
                     << " before FEATURES_REPLY";
        return;
    }

    switch (type) {
    case of13::OFPT_PACKET_IN:
        packet_in(conn, conn_data->dpid, bytes, arrival);
        break;
    case of13::OFPT_ERROR:
        error(conn_data->dpid, bytes);
        break;
    default:
        VLOG(8) << "[Controller] Unhandled message type=" << unsigned(type)
                << " len=" << len << " from dpid=" << conn_data->dpid;
        break;
    }
}); }

void Controller::implementation::features_reply(FluidConnection* conn,
                                                uint8_t* data)
{
    of13::FeaturesReply fr;
    if (fr.unpack(data) != 0) {
        LOG(WARNING) << "[Controller] Malformed FEATURES_REPLY from "
                        "connection " << conn->get_id();
        return;
    }

    auto dpid = fr.datapath_id();
    if (auto conn_data = fluid_conn_data::get(conn)) {
        if (conn_data->dpid != dpid) {
            LOG(ERROR) << "[Controller] Connection id=" << conn->get_id()
                       << " changed dpid from " << conn_data->dpid
                       << " to " << dpid << ", closing";
            conn->close();
        }
        return;
    }

    auto sw = std::make_shared<OFSwitchConnection>(conn, dpid, clock::now());
    {
        boost::unique_lock< boost::shared_mutex > lock(connections_mutex);
        auto it = connections.find(dpid);
        if (it != connections.end()) {
            auto old = it->second->fluid_conn();
            if (old && old != conn && old->is_alive()) {
                LOG(ERROR) << "[Controller] Duplicate dpid (" << dpid << ")"
                           << " detected between connections "
                           << old->get_id() << " and " << conn->get_id();
                conn->close();
                return;
            }
            it->second->detach();
            it->second = sw;
        } else {
            connections.emplace(dpid, sw);
        }
    }

    conn->set_application_data(new fluid_conn_data {dpid});
    LOG(INFO) << "[Controller] Connection id=" << conn->get_id()
              << " from " << conn->get_peer_address()
              << " ends on switch dpid=" << dpid;

    sw->reset_table();
    guard.connection_up(sw);
}

void Controller::implementation::packet_in(FluidConnection* conn,
                                           uint64_t dpid,
                                           uint8_t* data,
                                           clock::time_point arrival)
{
    of13::PacketIn pi;
    if (pi.unpack(data) != 0) {
        LOG(WARNING) << "[Controller] Malformed PACKET_IN from dpid="
                     << dpid << ", connection " << conn->get_id();
        return;
    }

    auto in_port = pi.match().in_port();
    if (not in_port) {
        LOG(WARNING) << "[Controller] PACKET_IN without in_port from dpid="
                     << dpid;
        return;
    }

    std::optional<uint32_t> buffer_id;
    if (pi.buffer_id() != OFP_NO_BUFFER)
        buffer_id = pi.buffer_id();

    auto frame = static_cast<const uint8_t*>(pi.data());
    std::vector<uint8_t> bytes(frame, frame + pi.data_len());

    guard.packet_in(dpid, in_port->value(), buffer_id, std::move(bytes),
                    arrival);
}

void Controller::implementation::error(uint64_t dpid, uint8_t* data)
{
    of13::Error err;
    if (err.unpack(data) != 0) {
        LOG(WARNING) << "[Controller] Malformed ERROR from dpid=" << dpid;
        return;
    }

    LOG(ERROR) << "[Controller] Error message received from switch with dpid="
               << dpid << ". Type=" << err.err_type()
               << ", code=" << err.code();
}

void Controller::implementation::connection_lost(FluidConnection* conn)
{
    auto conn_data = fluid_conn_data::get(conn);
    if (not conn_data)
        return;

    auto dpid = conn_data->dpid;
    conn->set_application_data(nullptr);
    delete conn_data;

    {
        boost::unique_lock< boost::shared_mutex > lock(connections_mutex);
        auto it = connections.find(dpid);
        if (it == connections.end() || it->second->fluid_conn() != conn)
            return;
        it->second->detach();
        connections.erase(it);
    }

    guard.connection_down(dpid);
}

void Controller::implementation::connection_callback(FluidConnection* conn,
                                                     FluidConnection::Event type)
{
    switch (type) {
    case FluidConnection::EVENT_STARTED:
        VLOG(3) << "Connection id=" << conn->get_id() << " from "
                << conn->get_peer_address() << " started";
        conn->set_application_data(nullptr);
    break;
    case FluidConnection::EVENT_ESTABLISHED:
        VLOG(3) << "Connection id=" << conn->get_id() << " from "
                << conn->get_peer_address() << " established";
    break;
    case FluidConnection::EVENT_FAILED_NEGOTIATION:
        LOG(WARNING) << "Connection id=" << conn->get_id() << " from "
                     << conn->get_peer_address()
                     << ": failed version negotiation";
    break;
    case FluidConnection::EVENT_CLOSED:
        LOG(INFO) << "Connection id=" << conn->get_id() << " from "
                  << conn->get_peer_address() << " closed by the user";
        connection_lost(conn);
    break;
    case FluidConnection::EVENT_DEAD:
        LOG(INFO) << "Connection id=" << conn->get_id() << " from "
                  << conn->get_peer_address() << " closed due to inactivity";
        connection_lost(conn);
    break;
    }
}

Controller::Controller(ArpGuard& guard, const ControllerSettings& settings)
    : impl(new implementation{guard, settings})
{
    LOG(INFO) << "[Controller] OpenFlow 1.3 on " << settings.address
              << ':' << settings.port << ", " << settings.nthreads
              << " worker thread(s)";
}

Controller::~Controller() = default;

void Controller::start()
{
    impl->start(/* block: */ false);
}

void Controller::stop()
{
    impl->stop();
}

} // namespace arpguard
