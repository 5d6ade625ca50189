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

#include <arpguard/core/exception.hpp>

#include <boost/exception/exception.hpp>

#include <exception>
#include <forward_list>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace arpguard {

struct unknown_exception_tag { };

struct diagnostic_information
{
    diagnostic_information() noexcept;
    explicit diagnostic_information( unknown_exception_tag );
    explicit diagnostic_information( exception_root const& e );
    explicit diagnostic_information( std::exception const& e );
    explicit diagnostic_information( boost::exception const& e );

    /**
     * Print formatted message to the log with ERROR severity.
     */
    void log() const;

    /**
     * Error message.
     */
    std::string what;

    /**
     * Location in the source code, empty if unknown.
     */
    std::string where;

    /**
     * Demangled type of the exception.
     */
    std::string exception_type;

    /**
     * Error-specific data, "name = value".
     */
    std::forward_list<std::string> with;
};

std::ostream& operator<<(std::ostream& out, diagnostic_information const& diag);

/**
 * Runs `f` and converts any escaping exception into diagnostic information.
 */
template<class F>
std::optional<diagnostic_information> catch_all(F&& f) noexcept
try {
    static_assert( std::is_same< std::invoke_result_t<F>, void >::value,
        "catch_all functor must be callable without arguments and return void" );

    try {
        f();
        return std::nullopt;
    } catch( exception_root const& e ) {
        return diagnostic_information{e};
    } catch( boost::exception const& e ) {
        return diagnostic_information{e};
    } catch( std::exception const& e ) {
        return diagnostic_information{e};
    } catch( ... ) {
        return diagnostic_information{unknown_exception_tag{}};
    }
} catch (std::bad_alloc&) {
    return diagnostic_information{};
}

template<class F>
std::optional<diagnostic_information> catch_all_and_log(F&& f) noexcept
{
    auto diag = catch_all(std::forward<F>(f));
    if (diag) {
        diag->log();
    }
    return diag;
}

} // namespace arpguard
