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

#include <reqbind/http/form_data.hh>
#include <reqbind/http/exception.hh>
#include <reqbind/http/mime_types.hh>
#include <reqbind/http/url.hh>
#include <reqbind/util/string_utils.hh>

#include <fmt/format.h>

#include <algorithm>

namespace reqbind {

namespace http {

std::vector<sstring> form_data::values(std::string_view name) const {
    std::vector<sstring> ret;
    for (auto&& [k, v] : _fields) {
        if (k == name) {
            ret.push_back(v);
        }
    }
    return ret;
}

bool form_data::has_field(std::string_view name) const {
    return std::any_of(_fields.begin(), _fields.end(), [name] (auto&& f) { return f.first == name; });
}

bool form_data::has_file(std::string_view name) const {
    return std::any_of(_files.begin(), _files.end(), [name] (auto&& f) { return f.file.field_name == name; });
}

std::optional<form_file> form_data::take_file(std::string_view name) {
    for (auto& slot : _files) {
        if (slot.file.field_name != name) {
            continue;
        }
        if (slot.taken) {
            throw stream_consumed_exception(fmt::format("file part '{}'", name));
        }
        slot.taken = true;
        return std::move(slot.file);
    }
    return std::nullopt;
}

form_data parse_urlencoded_form(std::string_view body) {
    form_data form;
    while (!body.empty()) {
        auto amp = body.find('&');
        auto pair = body.substr(0, amp);
        body = amp == std::string_view::npos ? std::string_view() : body.substr(amp + 1);
        if (pair.empty()) {
            continue;
        }
        auto eq = pair.find('=');
        auto raw_key = pair.substr(0, eq);
        auto raw_val = eq == std::string_view::npos ? std::string_view() : pair.substr(eq + 1);
        sstring key, val;
        if (!internal::url_decode(raw_key, key) || !internal::url_decode(raw_val, val)) {
            throw malformed_body_exception(fmt::format("invalid escape in form field '{}'", raw_key));
        }
        form.add_field(std::move(key), std::move(val));
    }
    return form;
}

namespace {

constexpr std::string_view crlf = "\r\n";

// Split "Name: value" part headers, terminated by the blank line already cut off
std::vector<std::pair<sstring, sstring>> parse_part_headers(std::string_view block) {
    std::vector<std::pair<sstring, sstring>> headers;
    while (!block.empty()) {
        auto eol = block.find(crlf);
        auto line = block.substr(0, eol);
        block = eol == std::string_view::npos ? std::string_view() : block.substr(eol + crlf.size());
        if (line.empty()) {
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            throw malformed_body_exception(fmt::format("invalid part header line '{}'", line));
        }
        headers.emplace_back(sstring(reqbind::internal::trim(line.substr(0, colon))), sstring(reqbind::internal::trim(line.substr(colon + 1))));
    }
    return headers;
}

const sstring* find_header(const std::vector<std::pair<sstring, sstring>>& headers, std::string_view name) {
    for (auto&& [k, v] : headers) {
        if (reqbind::internal::case_insensitive_cmp()(k, name)) {
            return &v;
        }
    }
    return nullptr;
}

void add_part(form_data& form, std::string_view head, std::string_view content) {
    auto headers = parse_part_headers(head);
    auto raw_cd = find_header(headers, "Content-Disposition");
    if (!raw_cd) {
        throw malformed_body_exception("part without Content-Disposition header");
    }
    auto cd = mime_types::parse_content_disposition(*raw_cd);
    if (!cd || cd->type != "form-data") {
        throw malformed_body_exception(fmt::format("invalid Content-Disposition '{}'", *raw_cd));
    }
    auto name = cd->param("name");
    if (!name) {
        throw malformed_body_exception("form-data part without a name");
    }
    auto filename = cd->param("filename");
    if (!filename) {
        form.add_field(std::move(*name), sstring(content));
        return;
    }
    form_file file;
    file.field_name = std::move(*name);
    file.filename = std::move(*filename);
    auto ct = find_header(headers, "Content-Type");
    file.content_type = ct ? *ct : sstring(mime_types::octet_stream);
    file.size = content.size();
    file.data = as_content_source(sstring(content));
    file.headers = std::move(headers);
    form.add_file(std::move(file));
}

}

form_data parse_multipart_form(std::string_view body, std::string_view boundary) {
    if (boundary.empty() || boundary.size() > 70) {
        throw malformed_body_exception("invalid multipart boundary");
    }
    const sstring delimiter = fmt::format("--{}", boundary);
    const sstring inner_delimiter = fmt::format("\r\n--{}", boundary);

    // skip the preamble
    size_t pos;
    if (body.substr(0, delimiter.size()) == delimiter) {
        pos = delimiter.size();
    } else {
        pos = body.find(inner_delimiter);
        if (pos == std::string_view::npos) {
            throw malformed_body_exception("multipart boundary not found");
        }
        pos += inner_delimiter.size();
    }

    form_data form;
    while (true) {
        auto rest = body.substr(pos);
        if (rest.substr(0, 2) == "--") {
            // close delimiter, the epilogue is ignored
            return form;
        }
        // transport padding may follow a delimiter
        while (!rest.empty() && (rest.front() == ' ' || rest.front() == '\t')) {
            rest.remove_prefix(1);
        }
        if (rest.substr(0, crlf.size()) != crlf) {
            throw malformed_body_exception("expected CRLF after multipart boundary");
        }
        rest.remove_prefix(crlf.size());

        std::string_view head;
        if (rest.substr(0, crlf.size()) == crlf) {
            rest.remove_prefix(crlf.size());
        } else {
            auto head_end = rest.find("\r\n\r\n");
            if (head_end == std::string_view::npos) {
                throw malformed_body_exception("unterminated part headers");
            }
            head = rest.substr(0, head_end);
            rest.remove_prefix(head_end + 4);
        }

        auto content_end = rest.find(inner_delimiter);
        if (content_end == std::string_view::npos) {
            throw malformed_body_exception("missing closing multipart boundary");
        }
        add_part(form, head, rest.substr(0, content_end));
        pos = body.size() - rest.size() + content_end + inner_delimiter.size();
    }
}

}

}
