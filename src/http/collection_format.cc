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

#include <reqbind/http/collection_format.hh>
#include <reqbind/util/string_utils.hh>

#include <algorithm>
#include <iterator>

namespace reqbind::httpd {

char collection_separator(collection_format format) noexcept {
    switch (format) {
    case collection_format::CSV: return ',';
    case collection_format::SSV: return ' ';
    case collection_format::TSV: return '\t';
    case collection_format::PIPES: return '|';
    case collection_format::MULTI: return '\0';
    }
    return ',';
}

std::vector<sstring> split_collection(std::string_view text, collection_format format) {
    std::vector<sstring> items;
    if (format == collection_format::MULTI) {
        if (!text.empty()) {
            items.emplace_back(text);
        }
        return items;
    }
    const char sep = collection_separator(format);
    const bool trim_items = format != collection_format::SSV;
    size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find(sep, start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto item = text.substr(start, end - start);
        if (trim_items) {
            item = reqbind::internal::trim(item);
        }
        if (!item.empty()) {
            items.emplace_back(item);
        }
        start = end + 1;
    }
    return items;
}

std::vector<sstring> split_collection(const std::vector<sstring>& values, collection_format format) {
    if (format == collection_format::MULTI) {
        std::vector<sstring> items;
        std::copy_if(values.begin(), values.end(), std::back_inserter(items), [] (const sstring& v) { return !v.empty(); });
        return items;
    }
    if (values.empty()) {
        return {};
    }
    return split_collection(values.front(), format);
}

}
