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

#define BOOST_TEST_MODULE AddressBindingTable tests

#include <boost/test/unit_test.hpp>
#include <boost/thread/thread.hpp>

#include "core/AddressBindingTable.hpp"

using namespace arpguard;
using Check = AddressBindingTable::Check;

BOOST_AUTO_TEST_SUITE( address_binding_table_tests )

BOOST_AUTO_TEST_CASE( empty_table ) {
    AddressBindingTable table;
    BOOST_CHECK_EQUAL(table.size(), 0u);
    BOOST_CHECK(not table.lookup(IPv4Addr("10.0.0.1")));
    BOOST_CHECK(table.check(IPv4Addr("10.0.0.1"), ethaddr("00:00:00:00:00:01"))
                == Check::Unknown);
}

BOOST_AUTO_TEST_CASE( assign_and_check ) {
    AddressBindingTable table;
    table.assign(IPv4Addr("10.0.0.1"), ethaddr("00:00:00:00:00:0a"));

    auto mac = table.lookup(IPv4Addr("10.0.0.1"));
    BOOST_REQUIRE(mac);
    BOOST_CHECK_EQUAL(*mac, ethaddr("00:00:00:00:00:0a"));

    BOOST_CHECK(table.check(IPv4Addr("10.0.0.1"), ethaddr("00:00:00:00:00:0a"))
                == Check::Match);
    BOOST_CHECK(table.check(IPv4Addr("10.0.0.1"), ethaddr("00:00:00:00:00:0b"))
                == Check::Mismatch);
    BOOST_CHECK(table.check(IPv4Addr("10.0.0.2"), ethaddr("00:00:00:00:00:0a"))
                == Check::Unknown);
}

BOOST_AUTO_TEST_CASE( last_write_wins ) {
    AddressBindingTable table;
    table.assign(IPv4Addr("10.0.0.1"), ethaddr("00:00:00:00:00:0a"));
    table.assign(IPv4Addr("10.0.0.1"), ethaddr("00:00:00:00:00:0b"));

    BOOST_CHECK_EQUAL(table.size(), 1u);
    BOOST_CHECK_EQUAL(*table.lookup(IPv4Addr("10.0.0.1")),
                      ethaddr("00:00:00:00:00:0b"));
}

BOOST_AUTO_TEST_CASE( one_mac_many_addresses ) {
    AddressBindingTable table;
    table.assign(IPv4Addr("10.0.0.1"), ethaddr("00:00:00:00:00:0a"));
    table.assign(IPv4Addr("10.0.0.2"), ethaddr("00:00:00:00:00:0a"));

    BOOST_CHECK_EQUAL(table.size(), 2u);
    BOOST_CHECK(table.check(IPv4Addr("10.0.0.2"), ethaddr("00:00:00:00:00:0a"))
                == Check::Match);
}

BOOST_AUTO_TEST_CASE( concurrent_writers_and_readers ) {
    AddressBindingTable table;
    const uint32_t base = 0x0a000000;
    const int per_thread = 500;

    boost::thread_group threads;
    for (int t = 0; t < 4; ++t) {
        threads.create_thread([&table, t, base, per_thread]() {
            for (int i = 0; i < per_thread; ++i) {
                uint32_t n = uint32_t(t * per_thread + i);
                table.assign(IPv4Addr(base + n), ethaddr(uint64_t(n + 1)));
                table.lookup(IPv4Addr(base + n / 2));
            }
        });
    }
    threads.join_all();

    BOOST_CHECK_EQUAL(table.size(), size_t(4 * per_thread));
    for (uint32_t n = 0; n < 4 * per_thread; ++n) {
        BOOST_CHECK(table.check(IPv4Addr(base + n), ethaddr(uint64_t(n + 1)))
                    == Check::Match);
    }
}

BOOST_AUTO_TEST_SUITE_END()
