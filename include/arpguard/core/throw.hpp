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

#include <boost/config.hpp> // BOOST_UNLIKELY
#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace arpguard {

/**
 * Nothrow string formatting. Falls back to the raw format string.
 */
template<class ... Args>
std::string nothrow_format(const char* format_str, Args const& ... args) noexcept
try {
    return fmt::format(format_str, args...);
} catch (fmt::format_error& ex) {
    try {
        return fmt::format("{} (FormatError: {})", format_str, ex.what());
    } catch (std::bad_alloc&) {
        return std::string();
    }
} catch (std::bad_alloc&) {
    return std::string();
}

namespace detail {

struct std_exception_shim : std::exception
{
    explicit std_exception_shim(std::string msg) noexcept
        : msg(std::move(msg))
    { }

    const char* what() const noexcept override
    { return msg.c_str(); }

    std::string msg;
};

template<class Exception>
class std_exception_base {
    static constexpr bool runtime_error
        = std::is_base_of<runtime_error_tag, Exception>::value;

    static constexpr bool logic_error
        = std::is_base_of<logic_error_tag, Exception>::value;

    static constexpr bool invalid_argument
        = std::is_base_of<invalid_argument_tag, Exception>::value;

    static_assert(not(runtime_error && logic_error),
        "Deriving from both runtime_error_tag and logic_error_tag is senseless.");

    static_assert(not std::is_base_of<std::exception, Exception>::value,
        "Exception type must not derive from std::exception. Use tags instead.");

    static_assert(std::is_base_of<exception_root, Exception>::value,
        "Exception must derive from exception_root");

public:
    using type =
        std::conditional_t<runtime_error, std::runtime_error,
        std::conditional_t<invalid_argument, std::invalid_argument,
        std::conditional_t<logic_error, std::logic_error,
                           std_exception_shim>>>;
};

template<class Exception,
         class StdException = typename std_exception_base<Exception>::type>
struct adapted_exception : StdException
                         , located_exception
                         , Exception
{
    adapted_exception(located_exception where, Exception&& e, std::string msg)
        : StdException{std::move(msg)}
        , located_exception{where}
        , Exception{std::move(e)}
    { }
};

} // namespace detail

/**
 * Merges a user exception with the matching std::exception and the throw
 * location.
 *
 *         -------------   ---------------------   ------------------
 *         | Exception |   | located_exception |   | std::exception |
 *         -------------   ---------------------   ------------------
 *               ^                   ^                      ^
 *               |            ---------------               |
 *               -------------| ResultType |-----------------
 *                            ---------------
 */
template<class Exception, class ... Args>
auto make_exception(located_exception where, Exception&& e,
                    const char* format_str, Args const& ... args)
{
    using E = std::remove_cv_t<std::remove_reference_t<Exception>>;
    return detail::adapted_exception<E>{
        where, E{std::forward<Exception>(e)},
        nothrow_format(format_str, args...)
    };
}

template<class Exception>
auto make_exception(located_exception where, Exception&& e)
{
    return make_exception(where, std::forward<Exception>(e), "");
}

#define ARPGUARD_LOCATED_EXCEPTION(ex, ...) \
    ::arpguard::located_exception{ARPGUARD_SOURCE_LOCATION, typeid((ex))}

#define ARPGUARD_MAKE_EXCEPTION(...) \
    (::arpguard::make_exception(ARPGUARD_LOCATED_EXCEPTION(__VA_ARGS__), __VA_ARGS__))

#define ARPGUARD_THROW(...) throw ARPGUARD_MAKE_EXCEPTION(__VA_ARGS__)

#define ARPGUARD_THROW_IF(expr, ...) \
    (BOOST_UNLIKELY(!!(expr)) ? (ARPGUARD_THROW(__VA_ARGS__)) : (void)0)

} // namespace arpguard
