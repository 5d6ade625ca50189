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

#define BOOST_TEST_MODULE catch_all tests

#include <stdexcept>

#include <boost/test/unit_test.hpp>
#include <boost/exception/exception.hpp>
#include <boost/throw_exception.hpp>

#include <arpguard/core/catch_all.hpp>
#include <arpguard/core/throw.hpp>

using namespace arpguard;

BOOST_AUTO_TEST_SUITE( catch_all_tests )

BOOST_AUTO_TEST_CASE( nothing_thrown ) {
    bool called = false;
    auto diag = catch_all([&]() { called = true; });
    BOOST_CHECK(called);
    BOOST_CHECK(not diag);
}

BOOST_AUTO_TEST_CASE( located_exception_details ) {
    auto diag = catch_all([]() {
        ARPGUARD_THROW(config_error("learning-switch.hold-down"),
                       "Bad value {}", -1);
    });
    BOOST_REQUIRE(diag);
    BOOST_CHECK_EQUAL(diag->what, "Bad value -1");
    BOOST_CHECK(not diag->where.empty());
    BOOST_CHECK_NE(diag->exception_type.find("config_error"), std::string::npos);
    BOOST_REQUIRE(not diag->with.empty());
    BOOST_CHECK_EQUAL(diag->with.front(), "key = learning-switch.hold-down");
}

BOOST_AUTO_TEST_CASE( throw_if ) {
    BOOST_CHECK_NO_THROW(ARPGUARD_THROW_IF(false, invalid_argument{}, "never"));
    BOOST_CHECK_THROW(ARPGUARD_THROW_IF(true, invalid_argument{}, "always"),
                      invalid_argument);
    BOOST_CHECK_THROW(ARPGUARD_THROW_IF(true, invalid_argument{}, "always"),
                      std::invalid_argument);
    BOOST_CHECK_THROW(ARPGUARD_THROW(malformed_packet("arp", 3), "short"),
                      std::runtime_error);
}

BOOST_AUTO_TEST_CASE( standard_exception ) {
    auto diag = catch_all([]() { throw std::out_of_range("index"); });
    BOOST_REQUIRE(diag);
    BOOST_CHECK_EQUAL(diag->what, "index");
    BOOST_CHECK(diag->where.empty());
    BOOST_CHECK_EQUAL(diag->exception_type, "std::out_of_range");
}

BOOST_AUTO_TEST_CASE( boost_exception ) {
    auto diag = catch_all([]() {
        BOOST_THROW_EXCEPTION(std::logic_error("boost"));
    });
    BOOST_REQUIRE(diag);
    BOOST_CHECK_NE(diag->what.find("boost"), std::string::npos);
}

BOOST_AUTO_TEST_CASE( unknown_exception ) {
    auto diag = catch_all_and_log([]() { throw 42; });
    BOOST_REQUIRE(diag);
    BOOST_CHECK_EQUAL(diag->what, "Unknown exception");
}

BOOST_AUTO_TEST_SUITE_END()
