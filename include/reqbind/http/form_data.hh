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
#include <reqbind/http/content_source.hh>

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace reqbind {

namespace http {

/// An uploaded file part of a multipart/form-data body
struct form_file {
    sstring field_name;
    sstring filename;
    sstring content_type;
    size_t size = 0;
    std::vector<std::pair<sstring, sstring>> headers;
    content_source data;
};

/**
 * Fields and file parts of a parsed form body.
 *
 * Field values keep the order in which they appeared in the body.
 * A file part can be handed out once: take_file() moves the part,
 * including its content stream, to the caller.
 */
class form_data {
    std::vector<std::pair<sstring, sstring>> _fields;
    struct file_slot {
        form_file file;
        bool taken = false;
    };
    std::vector<file_slot> _files;
public:
    void add_field(sstring name, sstring value) {
        _fields.emplace_back(std::move(name), std::move(value));
    }

    void add_file(form_file file) {
        _files.push_back(file_slot{std::move(file), false});
    }

    /// All values of field \c name, in body order
    std::vector<sstring> values(std::string_view name) const;

    bool has_field(std::string_view name) const;

    bool has_file(std::string_view name) const;

    size_t field_count() const noexcept {
        return _fields.size();
    }

    size_t file_count() const noexcept {
        return _files.size();
    }

    /**
     * Hand out the first file part named \c name.
     *
     * @return std::nullopt if there is no such part
     * @throws stream_consumed_exception if the part was already handed out
     */
    std::optional<form_file> take_file(std::string_view name);
};

/**
 * Parse an application/x-www-form-urlencoded body.
 *
 * @throws malformed_body_exception on an invalid percent escape
 */
form_data parse_urlencoded_form(std::string_view body);

/**
 * Parse a multipart/form-data body (RFC 7578) delimited by \c boundary.
 *
 * Parts with a filename become file parts, all others become fields.
 *
 * @throws malformed_body_exception if the body does not follow the
 *  multipart framing or a part lacks a form-data Content-Disposition
 */
form_data parse_multipart_form(std::string_view body, std::string_view boundary);

}

}
