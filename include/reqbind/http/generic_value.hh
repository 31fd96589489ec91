/*
 * This file is open source software, licensed to you under the terms
 * of the Apache License, Version 2.0 (the "License").  See the NOTICE file
 * distributed with this work for additional information regarding copyright
 * ownership.  You may not use this file except in compliance with the License.
 *
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */
/*
 * Copyright (C) 2026 The reqbind Authors
 */

#pragma once

#include <reqbind/core/sstring.hh>

#include <cstdint>
#include <iosfwd>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

namespace reqbind::httpd {

class generic_value;

using generic_array = std::vector<generic_value>;
/// Object members in document order
using generic_object = std::vector<std::pair<sstring, generic_value>>;

/// A decoded, schema-less value: what a body decoder produces and what
/// declared defaults are stored as.
class generic_value {
public:
    enum class kind {
        null,
        boolean,
        integer,
        real,
        string,
        array,
        object,
    };
private:
    std::variant<std::monostate, bool, int64_t, double, sstring, generic_array, generic_object> _value;
public:
    generic_value() noexcept = default;
    generic_value(bool v) : _value(v) {}
    generic_value(int v) : _value(int64_t(v)) {}
    generic_value(int64_t v) : _value(v) {}
    generic_value(double v) : _value(v) {}
    generic_value(sstring v) : _value(std::move(v)) {}
    generic_value(const char* v) : _value(sstring(v)) {}
    generic_value(generic_array v) : _value(std::move(v)) {}
    generic_value(generic_object v) : _value(std::move(v)) {}

    kind type() const noexcept {
        return static_cast<kind>(_value.index());
    }

    bool is_null() const noexcept {
        return type() == kind::null;
    }

    template <typename T>
    const T* get_if() const noexcept {
        return std::get_if<T>(&_value);
    }

    /// Member lookup; nullptr if this is not an object or has no such member
    const generic_value* find(std::string_view key) const noexcept;

    bool operator==(const generic_value& o) const;

    /// Compact JSON-like rendering, used in messages and logs
    sstring to_string() const;
};

std::string_view to_string(generic_value::kind k) noexcept;

std::ostream& operator<<(std::ostream& os, const generic_value& v);

}

template <>
struct fmt::formatter<reqbind::httpd::generic_value> : fmt::formatter<std::string_view> {
    auto format(const reqbind::httpd::generic_value& v, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(v.to_string(), ctx);
    }
};
