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

#include <reqbind/http/mime_types.hh>
#include <reqbind/util/string_utils.hh>

#include <cstring>

namespace reqbind {

namespace http {

namespace {

bool is_tspecial(char c) {
    return std::strchr("()<>@,;:\\\"/[]?=", c) != nullptr;
}

// tchar: any visible US-ASCII character that is not a tspecial
bool is_token_char(char c) {
    return c > ' ' && c < 0x7f && !is_tspecial(c);
}

std::string_view consume_token(std::string_view& s) {
    size_t i = 0;
    while (i < s.size() && is_token_char(s[i])) {
        ++i;
    }
    auto token = s.substr(0, i);
    s.remove_prefix(i);
    return token;
}

std::optional<sstring> consume_quoted_string(std::string_view& s) {
    // s starts with '"'
    sstring val;
    for (size_t i = 1; i < s.size(); ++i) {
        char c = s[i];
        if (c == '"') {
            s.remove_prefix(i + 1);
            return val;
        }
        if (c == '\\') {
            if (++i == s.size()) {
                break;
            }
            c = s[i];
        }
        val.push_back(c);
    }
    return std::nullopt;
}

using param_list = std::vector<std::pair<sstring, sstring>>;

// `*( ";" token "=" ( token / quoted-string ) )`, a trailing ';' is tolerated
bool consume_params(std::string_view rest, param_list& params) {
    while (true) {
        rest = reqbind::internal::trim(rest);
        if (rest.empty()) {
            return true;
        }
        if (rest.front() != ';') {
            return false;
        }
        rest.remove_prefix(1);
        rest = reqbind::internal::trim(rest);
        if (rest.empty()) {
            return true;
        }
        auto name = consume_token(rest);
        if (name.empty() || rest.empty() || rest.front() != '=') {
            return false;
        }
        rest.remove_prefix(1);
        sstring val;
        if (!rest.empty() && rest.front() == '"') {
            auto quoted = consume_quoted_string(rest);
            if (!quoted) {
                return false;
            }
            val = std::move(*quoted);
        } else {
            auto token = consume_token(rest);
            if (token.empty()) {
                return false;
            }
            val = sstring(token);
        }
        params.emplace_back(reqbind::internal::to_lower(name), std::move(val));
    }
}

std::optional<sstring> find_param(const param_list& params, std::string_view name) {
    for (auto&& [k, v] : params) {
        if (reqbind::internal::case_insensitive_cmp()(k, name)) {
            return v;
        }
    }
    return std::nullopt;
}

}

std::optional<sstring> media_type::param(std::string_view name) const {
    return find_param(params, name);
}

std::optional<sstring> content_disposition::param(std::string_view name) const {
    return find_param(params, name);
}

bool media_type::is(std::string_view mime_str) const {
    return reqbind::internal::case_insensitive_cmp()(mime(), mime_str);
}

bool media_type::has_suffix(std::string_view suffix) const {
    auto plus = subtype.rfind('+');
    return plus != sstring::npos && reqbind::internal::case_insensitive_cmp()(std::string_view(subtype).substr(plus + 1), suffix);
}

namespace mime_types {

std::optional<media_type> parse_media_type(std::string_view value) {
    auto rest = reqbind::internal::trim(value);
    media_type mt;

    auto type = consume_token(rest);
    if (type.empty() || rest.empty() || rest.front() != '/') {
        return std::nullopt;
    }
    rest.remove_prefix(1);
    auto subtype = consume_token(rest);
    if (subtype.empty()) {
        return std::nullopt;
    }
    mt.type = reqbind::internal::to_lower(type);
    mt.subtype = reqbind::internal::to_lower(subtype);

    if (!consume_params(rest, mt.params)) {
        return std::nullopt;
    }
    return mt;
}

std::optional<content_disposition> parse_content_disposition(std::string_view value) {
    auto rest = reqbind::internal::trim(value);
    content_disposition cd;

    auto type = consume_token(rest);
    if (type.empty()) {
        return std::nullopt;
    }
    cd.type = reqbind::internal::to_lower(type);
    if (!consume_params(rest, cd.params)) {
        return std::nullopt;
    }
    return cd;
}

}

}

}
