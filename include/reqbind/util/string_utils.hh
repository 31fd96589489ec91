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

#include <algorithm>
#include <cctype>
#include <string_view>

#include <reqbind/core/sstring.hh>

namespace reqbind {

namespace internal {

//
// Collection of utilities for working with strings.
//

struct case_insensitive_cmp {
    bool operator()(std::string_view s1, std::string_view s2) const {
        return std::equal(s1.begin(), s1.end(), s2.begin(), s2.end(),
                [](char a, char b) { return ::tolower(a) == ::tolower(b); });
    }
};

struct case_insensitive_hash {
    size_t operator()(sstring s) const {
        std::transform(s.begin(), s.end(), s.begin(), ::tolower);
        return std::hash<sstring>()(s);
    }
};

inline sstring to_lower(std::string_view s) {
    sstring ret(s);
    std::transform(ret.begin(), ret.end(), ret.begin(), ::tolower);
    return ret;
}

/// Strip leading and trailing spaces and tabs
inline std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

}

}
