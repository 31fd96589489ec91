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

#include <reqbind/http/date_time.hh>

#include <fmt/format.h>
#include <ostream>

namespace reqbind::httpd {

using namespace std::chrono;

namespace {

// Read exactly n decimal digits at s[pos]
bool parse_digits(std::string_view s, size_t& pos, size_t n, int& out) noexcept {
    if (pos + n > s.size()) {
        return false;
    }
    int v = 0;
    for (size_t i = 0; i < n; ++i) {
        char c = s[pos + i];
        if (c < '0' || c > '9') {
            return false;
        }
        v = v * 10 + (c - '0');
    }
    pos += n;
    out = v;
    return true;
}

bool expect(std::string_view s, size_t& pos, char c) noexcept {
    if (pos >= s.size() || s[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

bool parse_full_date(std::string_view s, size_t& pos, year_month_day& out) noexcept {
    int y, m, d;
    if (!parse_digits(s, pos, 4, y) || !expect(s, pos, '-')
            || !parse_digits(s, pos, 2, m) || !expect(s, pos, '-')
            || !parse_digits(s, pos, 2, d)) {
        return false;
    }
    out = year_month_day{year{y}, month{unsigned(m)}, day{unsigned(d)}};
    return out.ok();
}

}

std::optional<date> parse_date(std::string_view s) noexcept {
    size_t pos = 0;
    year_month_day ymd;
    if (!parse_full_date(s, pos, ymd) || pos != s.size()) {
        return std::nullopt;
    }
    return date{ymd};
}

std::optional<date_time> parse_date_time(std::string_view s) noexcept {
    size_t pos = 0;
    year_month_day ymd;
    if (!parse_full_date(s, pos, ymd) || !expect(s, pos, 'T')) {
        return std::nullopt;
    }
    int hh, mm, ss;
    if (!parse_digits(s, pos, 2, hh) || !expect(s, pos, ':')
            || !parse_digits(s, pos, 2, mm) || !expect(s, pos, ':')
            || !parse_digits(s, pos, 2, ss)) {
        return std::nullopt;
    }
    if (hh > 23 || mm > 59 || ss > 59) {
        return std::nullopt;
    }
    int64_t micros = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (s[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0 || digits > 9) {
            return std::nullopt;
        }
        for (; digits < 6; ++digits) {
            micros *= 10;
        }
    }
    minutes offset{0};
    if (expect(s, pos, 'Z')) {
        // UTC
    } else if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
        bool negative = s[pos++] == '-';
        int oh, om;
        if (!parse_digits(s, pos, 2, oh) || !expect(s, pos, ':') || !parse_digits(s, pos, 2, om)
                || oh > 23 || om > 59) {
            return std::nullopt;
        }
        offset = hours{oh} + minutes{om};
        if (negative) {
            offset = -offset;
        }
    } else {
        return std::nullopt;
    }
    if (pos != s.size()) {
        return std::nullopt;
    }
    auto local = sys_days{ymd} + hours{hh} + minutes{mm} + seconds{ss} + microseconds{micros};
    return date_time{local - offset, offset};
}

sstring to_string(const date& d) {
    return fmt::format("{:04d}-{:02d}-{:02d}", int(d.ymd.year()), unsigned(d.ymd.month()), unsigned(d.ymd.day()));
}

sstring to_string(const date_time& dt) {
    auto local = dt.instant + dt.offset;
    auto days = floor<std::chrono::days>(local);
    year_month_day ymd{days};
    hh_mm_ss<microseconds> tod{local - days};
    auto millis = duration_cast<milliseconds>(tod.subseconds()).count();
    sstring zone;
    if (dt.offset == minutes{0}) {
        zone = "Z";
    } else {
        auto abs = dt.offset < minutes{0} ? -dt.offset : dt.offset;
        zone = fmt::format("{}{:02d}:{:02d}", dt.offset < minutes{0} ? '-' : '+', abs.count() / 60, abs.count() % 60);
    }
    return fmt::format("{}T{:02d}:{:02d}:{:02d}.{:03d}{}", to_string(date{ymd}),
            tod.hours().count(), tod.minutes().count(), tod.seconds().count(), millis, zone);
}

std::ostream& operator<<(std::ostream& os, const date& d) {
    return os << to_string(d);
}

std::ostream& operator<<(std::ostream& os, const date_time& dt) {
    return os << to_string(dt);
}

}
