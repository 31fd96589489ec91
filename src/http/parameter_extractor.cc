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

#include <reqbind/http/parameter_extractor.hh>
#include <reqbind/http/exception.hh>
#include <reqbind/http/parameter_exception.hh>

#include <algorithm>
#include <new>
#include <system_error>

#include <fmt/format.h>

namespace reqbind::httpd {

http::form_data& binding_context::form() {
    if (_form) {
        return *_form;
    }
    if (_form_error) {
        std::rethrow_exception(_form_error);
    }
    try {
        if (!_request.has_header("Content-Type")) {
            if (_request.content_length != 0) {
                throw http::unsupported_media_type_exception("missing Content-Type for a form body");
            }
            _form.emplace();
            return *_form;
        }
        auto mt = _request.get_media_type();
        if (!mt) {
            throw http::unsupported_media_type_exception(
                fmt::format("malformed Content-Type '{}'", _request.get_header("Content-Type")));
        }
        if (mt->is(http::mime_types::multipart_form_data)) {
            auto boundary = mt->param("boundary");
            if (!boundary) {
                throw http::malformed_body_exception("multipart body without boundary");
            }
            auto body = _request.content_stream.read_all("request body");
            _form = http::parse_multipart_form(body, *boundary);
        } else if (mt->is(http::mime_types::form_urlencoded)) {
            auto body = _request.content_stream.read_all("request body");
            _form = http::parse_urlencoded_form(body);
        } else {
            throw http::unsupported_media_type_exception(
                fmt::format("expected a form body, got '{}'", mt->mime()));
        }
    } catch (...) {
        _form_error = std::current_exception();
        throw;
    }
    return *_form;
}

bool binding_context::claim_file(const sstring& name) {
    if (std::find(_claimed_files.begin(), _claimed_files.end(), name) != _claimed_files.end()) {
        return false;
    }
    _claimed_files.push_back(name);
    return true;
}

namespace {

// Runs a read of the request content; a failure of the content stream,
// the form parser or the body decoder becomes the error of the parameter
template <typename Func>
std::optional<raw_value> guarded(const binding_scope& s, Func&& read) {
    try {
        return read();
    } catch (const http::unsupported_media_type_exception& e) {
        s.fail(binding_error_kind::UNSUPPORTED_MEDIA_TYPE, e.what());
    } catch (const decode_exception& e) {
        s.fail(binding_error_kind::DECODE_FAILURE, e.what());
    } catch (const http::base_exception& e) {
        // malformed form bodies and streams read twice
        s.fail(binding_error_kind::DECODE_FAILURE, e.what());
    } catch (const std::system_error& e) {
        s.fail(binding_error_kind::DECODE_FAILURE, fmt::format("failed to read request content: {}", e.what()));
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& e) {
        s.fail(binding_error_kind::DECODE_FAILURE, fmt::format("failed to read request content: {}", e.what()));
    }
    return std::nullopt;
}

raw_value text_values(std::vector<sstring> values) {
    return raw_value{std::move(values)};
}

}

std::optional<raw_value> path_extractor::extract(const parameter_descriptor& d, binding_context& ctx, const binding_scope& s) const {
    if (!ctx.route().exists(d.name())) {
        if (d.required()) {
            s.fail(binding_error_kind::CONFIGURATION_ERROR,
                   fmt::format("the route does not provide path parameter '{}'", d.name()));
            return std::nullopt;
        }
        return raw_value{};
    }
    auto decoded = ctx.route().get_decoded_param(d.name());
    if (!decoded) {
        s.fail(binding_error_kind::MALFORMED_VALUE,
               format_validation_message(d.name(), ctx.route().at(d.name()), "Invalid percent encoding"));
        return std::nullopt;
    }
    return text_values({std::move(*decoded)});
}

std::optional<raw_value> query_extractor::extract(const parameter_descriptor& d, binding_context& ctx, const binding_scope&) const {
    auto values = ctx.request().get_query_param_array(d.name());
    if (!values) {
        return raw_value{};
    }
    return text_values(*values);
}

std::optional<raw_value> header_extractor::extract(const parameter_descriptor& d, binding_context& ctx, const binding_scope&) const {
    auto& req = ctx.request();
    if (!req.has_header(d.name())) {
        return raw_value{};
    }
    return text_values({req.get_header(d.name())});
}

std::optional<raw_value> form_extractor::extract(const parameter_descriptor& d, binding_context& ctx, const binding_scope& s) const {
    return guarded(s, [&] () -> std::optional<raw_value> {
        auto& form = ctx.form();
        if (!form.has_field(d.name())) {
            if (form.has_file(d.name())) {
                s.fail(binding_error_kind::MALFORMED_VALUE,
                       format_validation_message(d.name(), "", "Expected a form field, got a file part"));
                return std::nullopt;
            }
            return raw_value{};
        }
        return text_values(form.values(d.name()));
    });
}

std::optional<raw_value> file_extractor::extract(const parameter_descriptor& d, binding_context& ctx, const binding_scope& s) const {
    if (!ctx.claim_file(d.name())) {
        s.fail(binding_error_kind::CONFIGURATION_ERROR,
               fmt::format("file part '{}' is already bound to another parameter", d.name()));
        return std::nullopt;
    }
    auto& req = ctx.request();
    if (!req.has_header("Content-Type")) {
        s.fail(binding_error_kind::UNSUPPORTED_MEDIA_TYPE,
               fmt::format("file '{}' needs a multipart/form-data body, the request has no Content-Type", d.name()));
        return std::nullopt;
    }
    auto mt = req.get_media_type();
    if (!mt) {
        s.fail(binding_error_kind::UNSUPPORTED_MEDIA_TYPE,
               fmt::format("malformed Content-Type '{}'", req.get_header("Content-Type")));
        return std::nullopt;
    }
    if (!mt->is(http::mime_types::multipart_form_data)) {
        s.fail(binding_error_kind::UNSUPPORTED_MEDIA_TYPE,
               fmt::format("file '{}' needs a multipart/form-data body, got '{}'", d.name(), mt->mime()));
        return std::nullopt;
    }
    return guarded(s, [&] () -> std::optional<raw_value> {
        auto& form = ctx.form();
        auto file = form.take_file(d.name());
        if (!file) {
            if (form.has_field(d.name())) {
                s.fail(binding_error_kind::MALFORMED_VALUE,
                       format_validation_message(d.name(), "", "Expected a file part, got a plain form field"));
                return std::nullopt;
            }
            // a file descriptor always names a part of the upload, required or not
            s.fail(binding_error_kind::MISSING_REQUIRED,
                   fmt::format("the multipart body has no file part named '{}'", d.name()));
            return std::nullopt;
        }
        return raw_value{std::move(*file)};
    });
}

std::optional<raw_value> body_extractor::extract(const parameter_descriptor& d, binding_context& ctx, const binding_scope& s) const {
    if (!ctx.claim_body()) {
        s.fail(binding_error_kind::CONFIGURATION_ERROR,
               fmt::format("the request body is already bound to another parameter than '{}'", d.name()));
        return std::nullopt;
    }
    auto& req = ctx.request();
    if (req.content_stream.consumed()) {
        s.fail(binding_error_kind::DECODE_FAILURE, "the request body was already consumed");
        return std::nullopt;
    }
    return guarded(s, [&] () -> std::optional<raw_value> {
        auto payload = req.content_stream.read_all("request body");
        if (payload.empty()) {
            return raw_value{};
        }
        if (!req.has_header("Content-Type")) {
            s.fail(binding_error_kind::UNSUPPORTED_MEDIA_TYPE, "missing Content-Type for the request body");
            return std::nullopt;
        }
        auto mt = req.get_media_type();
        if (!mt) {
            s.fail(binding_error_kind::UNSUPPORTED_MEDIA_TYPE,
                   fmt::format("malformed Content-Type '{}'", req.get_header("Content-Type")));
            return std::nullopt;
        }
        auto& c = ctx.body_consumer();
        if (!c.supports(*mt)) {
            s.fail(binding_error_kind::UNSUPPORTED_MEDIA_TYPE,
                   fmt::format("no decoder for media type '{}'", mt->mime()));
            return std::nullopt;
        }
        auto body = http::as_content_source(std::move(payload));
        auto value = c.consume(body);
        if (value.is_null()) {
            return raw_value{};
        }
        return raw_value{std::move(value)};
    });
}

const parameter_extractor& extractor_for(const parameter_descriptor& d, parameter_location location) noexcept {
    static const path_extractor path;
    static const query_extractor query;
    static const header_extractor header;
    static const form_extractor form;
    static const file_extractor file;
    static const body_extractor body;

    switch (location) {
    case parameter_location::PATH: return path;
    case parameter_location::QUERY: return query;
    case parameter_location::HEADER: return header;
    case parameter_location::FORM:
        return d.type() == parameter_type::FILE ? static_cast<const parameter_extractor&>(file) : form;
    case parameter_location::FILE: return file;
    case parameter_location::BODY: return body;
    }
    return query;
}

}
