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

#include <reqbind/http/generic_value.hh>

#include <fmt/format.h>
#include <iterator>
#include <ostream>

namespace reqbind::httpd {

const generic_value* generic_value::find(std::string_view key) const noexcept {
    auto obj = get_if<generic_object>();
    if (!obj) {
        return nullptr;
    }
    for (auto&& [k, v] : *obj) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

bool generic_value::operator==(const generic_value& o) const {
    return _value == o._value;
}

namespace {

void append_quoted(fmt::memory_buffer& out, std::string_view s) {
    out.push_back('"');
    for (char c : s) {
        switch (c) {
        case '"': fmt::format_to(std::back_inserter(out), "\\\""); break;
        case '\\': fmt::format_to(std::back_inserter(out), "\\\\"); break;
        case '\n': fmt::format_to(std::back_inserter(out), "\\n"); break;
        case '\t': fmt::format_to(std::back_inserter(out), "\\t"); break;
        default: out.push_back(c);
        }
    }
    out.push_back('"');
}

void render(fmt::memory_buffer& out, const generic_value& v) {
    switch (v.type()) {
    case generic_value::kind::null:
        fmt::format_to(std::back_inserter(out), "null");
        break;
    case generic_value::kind::boolean:
        fmt::format_to(std::back_inserter(out), "{}", *v.get_if<bool>());
        break;
    case generic_value::kind::integer:
        fmt::format_to(std::back_inserter(out), "{}", *v.get_if<int64_t>());
        break;
    case generic_value::kind::real:
        fmt::format_to(std::back_inserter(out), "{}", *v.get_if<double>());
        break;
    case generic_value::kind::string:
        append_quoted(out, *v.get_if<sstring>());
        break;
    case generic_value::kind::array: {
        out.push_back('[');
        bool first = true;
        for (auto&& e : *v.get_if<generic_array>()) {
            if (!std::exchange(first, false)) {
                out.push_back(',');
            }
            render(out, e);
        }
        out.push_back(']');
        break;
    }
    case generic_value::kind::object: {
        out.push_back('{');
        bool first = true;
        for (auto&& [k, e] : *v.get_if<generic_object>()) {
            if (!std::exchange(first, false)) {
                out.push_back(',');
            }
            append_quoted(out, k);
            out.push_back(':');
            render(out, e);
        }
        out.push_back('}');
        break;
    }
    }
}

}

sstring generic_value::to_string() const {
    fmt::memory_buffer out;
    render(out, *this);
    return fmt::to_string(out);
}

std::string_view to_string(generic_value::kind k) noexcept {
    switch (k) {
    case generic_value::kind::null: return "null";
    case generic_value::kind::boolean: return "boolean";
    case generic_value::kind::integer: return "integer";
    case generic_value::kind::real: return "number";
    case generic_value::kind::string: return "string";
    case generic_value::kind::array: return "array";
    case generic_value::kind::object: return "object";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, const generic_value& v) {
    return os << v.to_string();
}

}
