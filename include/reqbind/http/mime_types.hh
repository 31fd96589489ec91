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

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace reqbind {

namespace http {

/// A parsed media type, e.g. `multipart/form-data; boundary=xyz`.
/// Type, subtype and parameter names are kept lower-cased.
struct media_type {
    sstring type;
    sstring subtype;
    std::vector<std::pair<sstring, sstring>> params;

    sstring mime() const {
        return type + "/" + subtype;
    }

    /// Look up a parameter by (case-insensitive) name
    std::optional<sstring> param(std::string_view name) const;

    /// Compare against a `type/subtype` string, ignoring case and parameters
    bool is(std::string_view mime) const;

    /// True for a structured syntax suffix, e.g. `application/problem+json` has suffix "json"
    bool has_suffix(std::string_view suffix) const;
};

/// A parsed Content-Disposition header, e.g. `form-data; name="file"; filename="a.txt"`
struct content_disposition {
    sstring type;
    std::vector<std::pair<sstring, sstring>> params;

    std::optional<sstring> param(std::string_view name) const;
};

namespace mime_types {

inline constexpr std::string_view json = "application/json";
inline constexpr std::string_view form_urlencoded = "application/x-www-form-urlencoded";
inline constexpr std::string_view multipart_form_data = "multipart/form-data";
inline constexpr std::string_view octet_stream = "application/octet-stream";

/**
 * Parse a Content-Type header value as specified by RFC 7231 section 3.1.1.1.
 *
 * @param value the raw header value
 * @return the media type, or std::nullopt if it is not `token/token` followed
 *  by well formed `; name=value` parameters
 */
std::optional<media_type> parse_media_type(std::string_view value);

/**
 * Parse a Content-Disposition header value (RFC 6266), as found in the
 * part headers of a multipart/form-data body.
 */
std::optional<content_disposition> parse_content_disposition(std::string_view value);

} // namespace mime_types

} // namespace http

}
