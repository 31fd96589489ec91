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

#include <reqbind/http/parameter_exception.hh>
#include <fmt/format.h>

namespace reqbind::httpd {

sstring format_validation_message(
        const sstring& param_name,
        const sstring& param_value,
        const sstring& reason) {
    if (!param_value.empty()) {
        return fmt::format("Parameter '{}' validation failed (value: '{}'): {}",
                          param_name, param_value, reason);
    } else {
        return fmt::format("Parameter '{}' validation failed: {}",
                          param_name, reason);
    }
}

descriptor_config_exception::descriptor_config_exception(
        const sstring& field,
        const sstring& reason)
    : binding_configuration_exception(field.empty()
        ? fmt::format("Invalid parameter descriptor: {}", reason)
        : fmt::format("Invalid parameter descriptor for field '{}': {}", field, reason))
    , _field(field) {
}

decode_exception::decode_exception(
        const sstring& media_type,
        const sstring& reason)
    : http::bad_request_exception(fmt::format("Cannot decode {} payload: {}", media_type, reason))
    , _media_type(media_type) {
}

} // namespace reqbind::httpd
