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
#include <iosfwd>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace Json {
class Value;
}

namespace reqbind::httpd {

/// Why a parameter could not be bound
enum class binding_error_kind {
    MISSING_REQUIRED,       ///< required, absent and without default
    MALFORMED_VALUE,        ///< not a valid value of the declared type and format
    MALFORMED_COLLECTION,   ///< an item failed, or the collection format is not allowed here
    UNSUPPORTED_MEDIA_TYPE, ///< content type missing, malformed or not the expected one
    DECODE_FAILURE,         ///< the body or form could not be read or decoded
    CONFIGURATION_ERROR     ///< the descriptors and the destination do not fit together
};

/// e.g. "missing-required"
std::string_view to_string(binding_error_kind kind) noexcept;

std::ostream& operator<<(std::ostream& os, binding_error_kind kind);

struct binding_error {
    /// Wire name, dotted and indexed below the top level, e.g. "friends[1].name"
    sstring name;
    /// Location as declared, e.g. "query"
    sstring in;
    binding_error_kind kind;
    sstring message;
};

/// The outcome of one bind call: every error found, in the order the
/// parameters are declared
class binding_result {
    std::vector<binding_error> _errors;
public:
    void add_error(binding_error error) {
        _errors.push_back(std::move(error));
    }

    void add_error(sstring name, sstring in, binding_error_kind kind, sstring message) {
        _errors.push_back(binding_error{std::move(name), std::move(in), kind, std::move(message)});
    }

    bool is_valid() const noexcept {
        return _errors.empty();
    }

    const std::vector<binding_error>& errors() const noexcept {
        return _errors;
    }

    /// An array with one {"name", "in", "kind", "message"} object per error
    Json::Value to_json() const;

    sstring to_json_string() const;
};

/// Names the value being bound and records its errors.
///
/// Nested values get their own scope: member() and element() extend the
/// name, e.g. "friends" to "friends[1]" to "friends[1].name".
class binding_scope {
    binding_result& _result;
    sstring _name;
    sstring _in;
public:
    binding_scope(binding_result& result, sstring name, sstring in)
        : _result(result), _name(std::move(name)), _in(std::move(in)) {}

    binding_scope member(std::string_view name) const;

    binding_scope element(size_t index) const;

    const sstring& name() const noexcept {
        return _name;
    }

    const sstring& in() const noexcept {
        return _in;
    }

    void fail(binding_error_kind kind, sstring message) const {
        _result.add_error(_name, _in, kind, std::move(message));
    }
};

}

template <>
struct fmt::formatter<reqbind::httpd::binding_error_kind> : fmt::formatter<std::string_view> {
    auto format(reqbind::httpd::binding_error_kind kind, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(to_string(kind), ctx);
    }
};

template <>
struct fmt::formatter<reqbind::httpd::binding_error> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
    auto format(const reqbind::httpd::binding_error& e, fmt::format_context& ctx) const -> decltype(ctx.out());
};

template <>
struct fmt::formatter<reqbind::httpd::binding_result> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
    auto format(const reqbind::httpd::binding_result& r, fmt::format_context& ctx) const -> decltype(ctx.out());
};
