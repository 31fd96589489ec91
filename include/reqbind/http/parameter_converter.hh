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
#include <reqbind/http/bound_value.hh>
#include <reqbind/http/date_time.hh>
#include <reqbind/http/generic_value.hh>
#include <reqbind/http/parameter_metadata.hh>
#include <reqbind/util/base64.hh>
#include <concepts>
#include <charconv>
#include <cmath>
#include <optional>
#include <string_view>

namespace reqbind::httpd {

// C++20 Concepts for parameter type constraints
template<typename T>
concept IntegralParameter = std::integral<T> && !std::same_as<T, bool>;

template<typename T>
concept FloatingPointParameter = std::floating_point<T>;

template<typename T>
concept BooleanParameter = std::same_as<T, bool>;

template<typename T>
concept StringParameter = std::same_as<T, sstring>;

// Compile-time type name helper
template<typename T>
consteval const char* type_name() {
    if constexpr (std::same_as<T, int32_t>) {
        return "int32";
    } else if constexpr (std::same_as<T, int64_t>) {
        return "int64";
    } else if constexpr (std::same_as<T, float>) {
        return "float";
    } else if constexpr (std::same_as<T, double>) {
        return "double";
    } else if constexpr (std::same_as<T, bool>) {
        return "boolean";
    } else if constexpr (StringParameter<T>) {
        return "string";
    } else if constexpr (std::same_as<T, date>) {
        return "date";
    } else if constexpr (std::same_as<T, date_time>) {
        return "date-time";
    } else if constexpr (std::same_as<T, bytes>) {
        return "byte";
    } else {
        return "unknown";
    }
}

namespace internal {

// std::from_chars does not take a leading '+'
inline std::string_view strip_plus(std::string_view value) noexcept {
    if (value.size() > 1 && value.front() == '+' && value[1] != '-' && value[1] != '+') {
        value.remove_prefix(1);
    }
    return value;
}

}

/// Type converter trait for parameter conversion
/// Specializations provide type-specific conversion logic.
/// convert() returns std::nullopt when the text is not a valid value.
template<typename T>
struct parameter_converter;

/// Generic implementation for ALL integral types (int32_t, int64_t, etc.)
template<IntegralParameter T>
struct parameter_converter<T> {
    static consteval parameter_format format_enum() {
        if constexpr (sizeof(T) <= 4) {
            return parameter_format::INT32;
        } else {
            return parameter_format::INT64;
        }
    }

    static std::optional<T> convert(std::string_view value) noexcept {
        value = internal::strip_plus(value);
        T result;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);

        // Out of range values fail here as well
        if (ec != std::errc{}) {
            return std::nullopt;
        }

        // Check that entire string was consumed
        if (ptr != value.data() + value.size()) {
            return std::nullopt;
        }

        return result;
    }
};

/// Generic implementation for ALL floating point types (float, double)
template<FloatingPointParameter T>
struct parameter_converter<T> {
    static consteval parameter_format format_enum() {
        if constexpr (std::same_as<T, float>) {
            return parameter_format::FLOAT;
        } else {
            return parameter_format::DOUBLE;
        }
    }

    static std::optional<T> convert(std::string_view value) noexcept {
        value = internal::strip_plus(value);
        T result;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);

        if (ec != std::errc{}) {
            return std::nullopt;
        }

        if (ptr != value.data() + value.size()) {
            return std::nullopt;
        }

        // from_chars also reads "inf" and "nan"
        if (!std::isfinite(result)) {
            return std::nullopt;
        }

        return result;
    }
};

/// Specialization for bool, only the canonical literals are accepted
template<BooleanParameter T>
struct parameter_converter<T> {
    static std::optional<bool> convert(std::string_view value) noexcept {
        if (value == "true") {
            return true;
        }
        if (value == "false") {
            return false;
        }
        return std::nullopt;
    }
};

/// Specialization for sstring (passthrough)
template<>
struct parameter_converter<sstring> {
    static std::optional<sstring> convert(std::string_view value) {
        return sstring(value);
    }
};

template<>
struct parameter_converter<date> {
    static std::optional<date> convert(std::string_view value) noexcept {
        return parse_date(value);
    }
};

template<>
struct parameter_converter<date_time> {
    static std::optional<date_time> convert(std::string_view value) noexcept {
        return parse_date_time(value);
    }
};

/// Standard, padded base64
template<>
struct parameter_converter<bytes> {
    static std::optional<bytes> convert(std::string_view value) {
        return util::base64_decode(value);
    }
};

/// Convert one text item to the scalar type and format declared by \c d
/// (STRING, INTEGER, NUMBER or BOOLEAN).
/// Returns std::nullopt if the text is not a valid value of that type, or
/// if the declared type is not a scalar.
std::optional<bound_value> coerce_text(const parameter_descriptor& d, std::string_view text);

/// Convert a decoded value to the type declared by \c d.
///
/// Strings are parsed like text items, numbers are range checked into the
/// declared width, arrays are converted item by item with the item
/// descriptor, and objects are kept as generic values for the destination
/// to map member by member.
/// On failure returns std::nullopt and describes the problem in \c reason.
std::optional<bound_value> coerce_generic(const parameter_descriptor& d, const generic_value& v, sstring& reason);

} // namespace reqbind::httpd
