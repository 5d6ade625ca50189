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

#define BOOST_TEST_MODULE IPv4Addr tests

#include <unordered_set>
#include <sstream>

#include <boost/test/unit_test.hpp>

#include "types/IPv4Addr.hh"

using arpguard::IPv4Addr;

BOOST_AUTO_TEST_SUITE( ipv4addr_tests )

BOOST_AUTO_TEST_CASE( constructors_test ) {
    BOOST_CHECK_EQUAL(IPv4Addr(), IPv4Addr("0.0.0.0"));
    BOOST_CHECK_EQUAL(IPv4Addr("10.0.0.1"), IPv4Addr(0x0a000001U));
    BOOST_CHECK_EQUAL(IPv4Addr("192.168.1.254"),
                      IPv4Addr(IPv4Addr::bytes_type{{192, 168, 1, 254}}));
    BOOST_CHECK_EQUAL(IPv4Addr("10.0.0.1").to_number(), 0x0a000001U);
}

BOOST_AUTO_TEST_CASE( error_handling_test ) {
    BOOST_CHECK_THROW(IPv4Addr(""), IPv4Addr::bad_representation);
    BOOST_CHECK_THROW(IPv4Addr("10.0.0"), IPv4Addr::bad_representation);
    BOOST_CHECK_THROW(IPv4Addr("10.0.0.256"), IPv4Addr::bad_representation);
    BOOST_CHECK_THROW(IPv4Addr("10.0.0.1.1"), IPv4Addr::bad_representation);
    BOOST_CHECK_THROW(IPv4Addr("a.b.c.d"), IPv4Addr::bad_representation);
    BOOST_CHECK_THROW(IPv4Addr(" 10.0.0.1"), IPv4Addr::bad_representation);
}

BOOST_AUTO_TEST_CASE( operators_test ) {
    BOOST_CHECK(IPv4Addr("10.0.0.1") < IPv4Addr("10.0.0.2"));
    BOOST_CHECK_NE(IPv4Addr("10.0.0.1"), IPv4Addr("10.0.0.2"));

    std::unordered_set<IPv4Addr> set;
    set.emplace("10.0.0.1");
    set.emplace("10.0.0.1");
    set.emplace("10.0.0.2");
    BOOST_CHECK_EQUAL(set.size(), 2u);

    std::ostringstream oss;
    oss << IPv4Addr(0xc0a80001U);
    BOOST_CHECK_EQUAL(oss.str(), "192.168.0.1");
}

BOOST_AUTO_TEST_CASE( properties_test ) {
    BOOST_CHECK(is_loopback(IPv4Addr("127.0.0.1")));
    BOOST_CHECK(!is_loopback(IPv4Addr("128.0.0.1")));
    BOOST_CHECK(is_multicast(IPv4Addr("224.0.0.251")));
    BOOST_CHECK(!is_multicast(IPv4Addr("10.0.0.1")));
    BOOST_CHECK(is_broadcast(IPv4Addr("255.255.255.255")));
    BOOST_CHECK(is_unspecified(IPv4Addr("0.0.0.0")));
    BOOST_CHECK(!is_unspecified(IPv4Addr("10.0.0.1")));
}

BOOST_AUTO_TEST_SUITE_END()
