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

#include <reqbind/http/exception.hh>
#include <reqbind/core/sstring.hh>

namespace reqbind::httpd {

/// Formats the message attached to a parameter that failed to bind,
/// e.g. "Parameter 'id' validation failed (value: 'abc'): Cannot convert to type 'int64'"
sstring format_validation_message(const sstring& param_name,
                                  const sstring& param_value,
                                  const sstring& reason);

/// Thrown while assembling a binder from inconsistent pieces, e.g. two
/// descriptors registered for the same destination field
class binding_configuration_exception : public http::base_exception {
public:
    explicit binding_configuration_exception(const sstring& msg)
        : http::base_exception(msg) {}
};

/// Thrown when a descriptor document cannot be turned into descriptors
class descriptor_config_exception : public binding_configuration_exception {
    sstring _field;

public:
    descriptor_config_exception(const sstring& field, const sstring& reason);

    /// The destination field of the offending descriptor (empty if unknown)
    const sstring& field() const noexcept { return _field; }
};

/// Thrown by a body decoder when the payload is not valid for its media type
class decode_exception : public http::bad_request_exception {
    sstring _media_type;

public:
    decode_exception(const sstring& media_type, const sstring& reason);

    const sstring& media_type() const noexcept { return _media_type; }
};

} // namespace reqbind::httpd
