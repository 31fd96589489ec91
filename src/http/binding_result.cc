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

#include <reqbind/http/binding_result.hh>

#include <fmt/format.h>
#include <json/json.h>
#include <ostream>

namespace reqbind::httpd {

std::string_view to_string(binding_error_kind kind) noexcept {
    switch (kind) {
    case binding_error_kind::MISSING_REQUIRED: return "missing-required";
    case binding_error_kind::MALFORMED_VALUE: return "malformed-value";
    case binding_error_kind::MALFORMED_COLLECTION: return "malformed-collection";
    case binding_error_kind::UNSUPPORTED_MEDIA_TYPE: return "unsupported-media-type";
    case binding_error_kind::DECODE_FAILURE: return "decode-failure";
    case binding_error_kind::CONFIGURATION_ERROR: return "configuration-error";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, binding_error_kind kind) {
    return os << to_string(kind);
}

Json::Value binding_result::to_json() const {
    Json::Value list(Json::arrayValue);
    for (auto&& e : _errors) {
        Json::Value entry(Json::objectValue);
        entry["name"] = e.name;
        entry["in"] = e.in;
        entry["kind"] = std::string(to_string(e.kind));
        entry["message"] = e.message;
        list.append(std::move(entry));
    }
    return list;
}

binding_scope binding_scope::member(std::string_view name) const {
    if (_name.empty()) {
        return binding_scope(_result, sstring(name), _in);
    }
    return binding_scope(_result, fmt::format("{}.{}", _name, name), _in);
}

binding_scope binding_scope::element(size_t index) const {
    return binding_scope(_result, fmt::format("{}[{}]", _name, index), _in);
}

sstring binding_result::to_json_string() const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, to_json());
}

}

auto fmt::formatter<reqbind::httpd::binding_error>::format(const reqbind::httpd::binding_error& e, fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{} ({}) {}: {}", e.name, e.in, e.kind, e.message);
}

auto fmt::formatter<reqbind::httpd::binding_result>::format(const reqbind::httpd::binding_result& r, fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
    if (r.is_valid()) {
        return fmt::format_to(ctx.out(), "valid");
    }
    auto out = fmt::format_to(ctx.out(), "{} binding error(s)", r.errors().size());
    for (auto&& e : r.errors()) {
        out = fmt::format_to(out, "; {}", e);
    }
    return out;
}
