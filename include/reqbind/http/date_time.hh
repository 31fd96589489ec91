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

#include <chrono>
#include <iosfwd>
#include <optional>
#include <string_view>

#include <fmt/core.h>

namespace reqbind::httpd {

/// A calendar date without a time of day (`full-date` of RFC 3339)
struct date {
    std::chrono::year_month_day ymd;

    bool operator==(const date&) const = default;
};

/// An instant together with the UTC offset it was written with.
///
/// Two date_time values compare equal when they denote the same instant,
/// whatever their offsets.
struct date_time {
    std::chrono::sys_time<std::chrono::microseconds> instant;
    std::chrono::minutes offset{0};

    bool operator==(const date_time& o) const noexcept {
        return instant == o.instant;
    }
};

/// Parse `YYYY-MM-DD`
std::optional<date> parse_date(std::string_view s) noexcept;

/// Parse an RFC 3339 `date-time`: `YYYY-MM-DDTHH:MM:SS[.frac](Z|+HH:MM|-HH:MM)`.
/// Fractional seconds beyond microsecond precision are truncated.
std::optional<date_time> parse_date_time(std::string_view s) noexcept;

sstring to_string(const date& d);

/// Renders in the original offset with millisecond precision,
/// e.g. `2014-10-12T08:05:05.000Z`
sstring to_string(const date_time& dt);

std::ostream& operator<<(std::ostream& os, const date& d);
std::ostream& operator<<(std::ostream& os, const date_time& dt);

}

template <>
struct fmt::formatter<reqbind::httpd::date> : fmt::formatter<std::string_view> {
    auto format(const reqbind::httpd::date& d, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(to_string(d), ctx);
    }
};

template <>
struct fmt::formatter<reqbind::httpd::date_time> : fmt::formatter<std::string_view> {
    auto format(const reqbind::httpd::date_time& dt, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(to_string(dt), ctx);
    }
};
