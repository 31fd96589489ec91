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
#include <reqbind/http/date_time.hh>
#include <reqbind/http/form_data.hh>
#include <reqbind/http/generic_value.hh>

#include <concepts>
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace reqbind::httpd {

/// A decoded byte blob (`string/byte`)
using bytes = std::vector<uint8_t>;

/// An uploaded file handed to the destination: metadata plus the
/// read-once content stream
using file_upload = http::form_file;

struct bound_value;

using bound_list = std::vector<bound_value>;

/// A value converted to its declared type and format, ready to be
/// assigned into a destination field
struct bound_value {
    std::variant<bool, int32_t, int64_t, float, double, sstring,
                 date, date_time, bytes, file_upload, bound_list, generic_value> value;

    template <typename T>
    requires (!std::same_as<std::remove_cvref_t<T>, bound_value>)
    bound_value(T&& v) : value(std::forward<T>(v)) {}

    bound_value(bound_value&&) noexcept = default;
    bound_value& operator=(bound_value&&) noexcept = default;

    template <typename T>
    T* get_if() noexcept {
        return std::get_if<T>(&value);
    }

    template <typename T>
    const T* get_if() const noexcept {
        return std::get_if<T>(&value);
    }

    /// Short name of the held alternative, e.g. "int64" or "list"
    std::string_view kind_name() const noexcept;
};

}
