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

#include <arpguard/core/catch_all.hpp>
#include <arpguard/core/logging.hpp>

#include <boost/core/demangle.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <fmt/format.h>


namespace arpguard {

diagnostic_information::diagnostic_information() noexcept
{ }

diagnostic_information::diagnostic_information(unknown_exception_tag)
    : what("Unknown exception")
{ }

diagnostic_information::diagnostic_information( exception_root const& e )
    : what(e.what())
    , exception_type(boost::core::demangle(e.type().name()))
{
    const auto& loc = e.where();
    if (loc.line != 0) {
        where = fmt::format("{} @ {}:{}", loc.function_name,
                                          loc.file_name,
                                          loc.line);
    }
    for (auto& p : e.with()) {
        with.push_front(fmt::format("{} = {}", p.first, p.second));
    }
}

diagnostic_information::diagnostic_information( std::exception const& e )
    : what(e.what())
    , exception_type(boost::core::demangle(typeid(e).name()))
{ }

diagnostic_information::diagnostic_information( boost::exception const& e )
    : what(boost::diagnostic_information_what(e))
    , exception_type(boost::core::demangle(typeid(e).name()))
{ }

void diagnostic_information::log() const
{
    LOG(ERROR) << *this;
}

std::ostream& operator<<(std::ostream& out, diagnostic_information const& diag)
{
    out << diag.exception_type << ": " << diag.what;
    if (not diag.where.empty()) {
        out << " (thrown in " << diag.where << ")";
    }
    for (auto& w : diag.with) {
        out << "; " << w;
    }
    return out;
}

} // namespace arpguard
