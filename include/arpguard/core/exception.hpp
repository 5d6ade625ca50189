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

#include <fmt/format.h>

#include <cstdint>
#include <forward_list>
#include <string>
#include <typeinfo>
#include <utility>

namespace arpguard {

struct source_location
{
    const char* function_name;
    const char* file_name;
    std::uint_least32_t line;
};

#define ARPGUARD_SOURCE_LOCATION \
    ::arpguard::source_location { __PRETTY_FUNCTION__, __FILE__, __LINE__ }

/**
 * Semantic tags used by `make_exception` to pick the std::exception base.
 */
struct runtime_error_tag { };
struct logic_error_tag { };
struct invalid_argument_tag { };

/**
 * Root of every arpguard exception type.
 *
 * User types derive from it (plus a tag) and must not derive from
 * std::exception themselves: `ARPGUARD_THROW` merges them with the right
 * standard base and with the throw location.
 */
class exception_root {
public:
    using details = std::forward_list< std::pair<const char*, std::string> >;

    exception_root() noexcept = default;
    exception_root(exception_root const&) = default;
    exception_root(exception_root&&) noexcept = default;
    virtual ~exception_root() noexcept = default;

    /** Same as std::exception::what(). */
    const char* what() const noexcept;

    /** Where the exception was thrown, "unknown" if not by ARPGUARD_THROW. */
    const source_location& where() const noexcept;

    /** Type originally passed to ARPGUARD_THROW. */
    const std::type_info& type() const noexcept;

    /** Serialized (name, value) pairs attached with `with()`. */
    const details& with() const noexcept { return with_; }

protected:
    template<class T>
    void with(const char* name, T const& info) noexcept
    try {
        with_.emplace_front(name, fmt::format("{}", info));
    } catch (fmt::format_error& e) {
        try {
            with_.emplace_front(name, fmt::format("FormatError: {}", e.what()));
        } catch (std::bad_alloc&) { }
    } catch (std::bad_alloc&) { }

private:
    details with_;
};

/**
 * Throw site information carried by every exception thrown with
 * ARPGUARD_THROW.
 */
struct located_exception
{
    located_exception(source_location where, std::type_info const& type) noexcept
        : where_(where), type_(&type)
    { }

    const source_location& where() const noexcept { return where_; }
    const std::type_info& type() const noexcept { return *type_; }

private:
    source_location where_;
    std::type_info const* type_;
};

/**
 * Wrong argument passed by the caller. Useful as is.
 */
struct invalid_argument : exception_root, invalid_argument_tag { };

/**
 * Bad configuration value or unreadable configuration file.
 */
struct config_error : exception_root, runtime_error_tag
{
    config_error() = default;

    explicit config_error(std::string key)
    {
        with("key", key);
    }
};

/**
 * Frame too short or inconsistent to decode.
 */
struct malformed_packet : exception_root, runtime_error_tag
{
    malformed_packet(const char* layer, size_t available)
    {
        with("layer", layer);
        with("available", available);
    }
};

} // namespace arpguard
