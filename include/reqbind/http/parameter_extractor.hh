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
#include <reqbind/http/binding_result.hh>
#include <reqbind/http/bound_value.hh>
#include <reqbind/http/common.hh>
#include <reqbind/http/consumer.hh>
#include <reqbind/http/form_data.hh>
#include <reqbind/http/generic_value.hh>
#include <reqbind/http/parameter_metadata.hh>
#include <reqbind/http/request.hh>

#include <exception>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace reqbind::httpd {

/// What a location holds for one parameter: nothing, its text values, the
/// decoded body, or a file part
struct raw_value {
    std::variant<std::monostate, std::vector<sstring>, generic_value, file_upload> value;

    bool absent() const noexcept {
        return std::holds_alternative<std::monostate>(value);
    }
};

/**
 * State shared by the parameters of one bind call.
 *
 * The form body is parsed on first use and kept for the rest of the call.
 * The body and each file part can be claimed by a single parameter.
 */
class binding_context {
    http::request& _request;
    const http::route_params& _route;
    const consumer& _consumer;
    std::optional<http::form_data> _form;
    std::exception_ptr _form_error;
    bool _body_claimed = false;
    std::vector<sstring> _claimed_files;
public:
    binding_context(http::request& req, const http::route_params& route, const consumer& c) noexcept
        : _request(req), _route(route), _consumer(c) {}

    http::request& request() noexcept {
        return _request;
    }

    const http::route_params& route() const noexcept {
        return _route;
    }

    const consumer& body_consumer() const noexcept {
        return _consumer;
    }

    /**
     * The parsed url-encoded or multipart form body. A request without
     * content type and content has an empty form.
     *
     * @throws http::unsupported_media_type_exception if the body is not a form
     * @throws http::malformed_body_exception if the form cannot be parsed
     * @throws http::stream_consumed_exception if the body was read before
     * A failure is thrown again on every later call.
     */
    http::form_data& form();

    /// false if another parameter already claimed the body
    bool claim_body() noexcept {
        return !std::exchange(_body_claimed, true);
    }

    /// false if another parameter already claimed file part \c name
    bool claim_file(const sstring& name);
};

/// Reads the raw value of a parameter from one request location
class parameter_extractor {
public:
    virtual ~parameter_extractor() = default;

    virtual parameter_location location() const noexcept = 0;

    /**
     * @return the raw value, possibly absent, or std::nullopt after
     *  recording in \c s why the location could not be read
     */
    virtual std::optional<raw_value> extract(const parameter_descriptor& d, binding_context& ctx, const binding_scope& s) const = 0;
};

/// Route parameter, path decoded
class path_extractor final : public parameter_extractor {
public:
    parameter_location location() const noexcept override { return parameter_location::PATH; }
    std::optional<raw_value> extract(const parameter_descriptor& d, binding_context& ctx, const binding_scope& s) const override;
};

/// Every occurrence of a query parameter, in url order
class query_extractor final : public parameter_extractor {
public:
    parameter_location location() const noexcept override { return parameter_location::QUERY; }
    std::optional<raw_value> extract(const parameter_descriptor& d, binding_context& ctx, const binding_scope& s) const override;
};

class header_extractor final : public parameter_extractor {
public:
    parameter_location location() const noexcept override { return parameter_location::HEADER; }
    std::optional<raw_value> extract(const parameter_descriptor& d, binding_context& ctx, const binding_scope& s) const override;
};

/// Every value of a plain form field
class form_extractor final : public parameter_extractor {
public:
    parameter_location location() const noexcept override { return parameter_location::FORM; }
    std::optional<raw_value> extract(const parameter_descriptor& d, binding_context& ctx, const binding_scope& s) const override;
};

/// A multipart file part, handed out once
class file_extractor final : public parameter_extractor {
public:
    parameter_location location() const noexcept override { return parameter_location::FILE; }
    std::optional<raw_value> extract(const parameter_descriptor& d, binding_context& ctx, const binding_scope& s) const override;
};

/// The request body, decoded by the consumer of the bind call
class body_extractor final : public parameter_extractor {
public:
    parameter_location location() const noexcept override { return parameter_location::BODY; }
    std::optional<raw_value> extract(const parameter_descriptor& d, binding_context& ctx, const binding_scope& s) const override;
};

/// The extractor of a location. File typed form parameters are read as
/// file parts.
const parameter_extractor& extractor_for(const parameter_descriptor& d, parameter_location location) noexcept;

}
