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

#include <reqbind/http/request_binder.hh>
#include <reqbind/http/collection_format.hh>
#include <reqbind/http/parameter_converter.hh>
#include <reqbind/http/parameter_extractor.hh>
#include <reqbind/util/log.hh>

#include <algorithm>

#include <fmt/format.h>

namespace reqbind::httpd {

static logger rlogger("request_binder");

namespace {

bool reads_content(const parameter_descriptor& d) {
    auto l = d.location();
    return l == parameter_location::BODY || l == parameter_location::FORM || l == parameter_location::FILE;
}

// Absent, or present with an empty text value
bool empty_scalar(const std::vector<sstring>& values) {
    return values.empty() || values.front().empty();
}

}

binder_core::binder_core(parameter_registry registry)
    : _registry(std::move(registry)) {
    rlogger.debug("binder created with {} parameter(s)", _registry.size());
}

binding_result binder_core::bind(http::request& req, const http::route_params& route, const consumer& c, binding_target& target) const {
    binding_result result;
    binding_context ctx(req, route, c);

    if (req.content_stream.consumed()
            && std::any_of(_registry.begin(), _registry.end(), [] (auto& p) { return reads_content(p.second); })) {
        rlogger.warn("{} {}: request body was consumed before binding", req._method, req._url);
    }

    for (auto&& [field, d] : _registry) {
        bind_parameter(field, d, ctx, target, result);
    }

    if (!result.is_valid()) {
        rlogger.debug("{} {}: {}", req._method, req._url, result);
    }
    return result;
}

void binder_core::bind_parameter(const sstring& field, const parameter_descriptor& d, binding_context& ctx,
                                 binding_target& target, binding_result& result) const {
    binding_scope s(result, d.name(), d.in());
    rlogger.trace("binding field '{}' from {} parameter '{}'", field, d.in(), d.name());

    if (!d.location()) {
        s.fail(binding_error_kind::CONFIGURATION_ERROR, fmt::format("unknown parameter location '{}'", d.in()));
        return;
    }
    auto location = *d.location();
    if (!target.has_field(field)) {
        s.fail(binding_error_kind::CONFIGURATION_ERROR, fmt::format("no destination field '{}'", field));
        return;
    }
    if (d.type() == parameter_type::ARRAY) {
        if (d.collection() == collection_format::MULTI && location != parameter_location::QUERY) {
            s.fail(binding_error_kind::MALFORMED_COLLECTION,
                   fmt::format("collection format 'multi' is only supported for query parameters, not in {}", d.in()));
            return;
        }
        if (!d.items()) {
            s.fail(binding_error_kind::CONFIGURATION_ERROR, "array parameter without an item descriptor");
            return;
        }
    }

    auto raw = extractor_for(d, location).extract(d, ctx, s);
    if (!raw) {
        return;
    }

    auto apply_absent = [&] {
        if (d.default_value()) {
            sstring reason;
            auto value = coerce_generic(d, *d.default_value(), reason);
            if (!value) {
                s.fail(binding_error_kind::CONFIGURATION_ERROR, fmt::format("invalid default value {}: {}", *d.default_value(), reason));
                return;
            }
            target.assign(field, std::move(*value), d, s);
        } else if (d.required()) {
            s.fail(binding_error_kind::MISSING_REQUIRED, format_validation_message(d.name(), "", "Value is required"));
        }
    };

    if (raw->absent()) {
        apply_absent();
        return;
    }

    if (auto file = std::get_if<file_upload>(&raw->value)) {
        target.assign(field, bound_value(std::move(*file)), d, s);
        return;
    }

    if (auto decoded = std::get_if<generic_value>(&raw->value)) {
        sstring reason;
        auto value = coerce_generic(d, *decoded, reason);
        if (!value) {
            s.fail(binding_error_kind::MALFORMED_VALUE, format_validation_message(d.name(), "", reason));
            return;
        }
        target.assign(field, std::move(*value), d, s);
        return;
    }

    auto& values = std::get<std::vector<sstring>>(raw->value);
    if (d.type() == parameter_type::ARRAY) {
        auto items = split_collection(values, d.collection());
        if (items.empty() && d.required()) {
            s.fail(binding_error_kind::MISSING_REQUIRED, format_validation_message(d.name(), "", "Value is required"));
            return;
        }
        bound_list list;
        list.reserve(items.size());
        for (size_t i = 0; i < items.size(); ++i) {
            sstring reason;
            auto item = coerce_generic(*d.items(), generic_value(items[i]), reason);
            if (!item) {
                s.fail(binding_error_kind::MALFORMED_COLLECTION,
                       format_validation_message(d.name(), items[i], fmt::format("item {}: {}", i, reason)));
                return;
            }
            list.push_back(std::move(*item));
        }
        target.assign(field, bound_value(std::move(list)), d, s);
        return;
    }

    if (empty_scalar(values)) {
        apply_absent();
        return;
    }
    const auto& text = values.front();
    switch (d.type()) {
    case parameter_type::OBJECT:
        s.fail(binding_error_kind::CONFIGURATION_ERROR,
               fmt::format("object parameters can only be read from the body, not from {}", d.in()));
        return;
    case parameter_type::FILE:
        s.fail(binding_error_kind::CONFIGURATION_ERROR,
               fmt::format("file parameters can only be read from a multipart body, not from {}", d.in()));
        return;
    default:
        break;
    }
    auto value = coerce_text(d, text);
    if (!value) {
        s.fail(binding_error_kind::MALFORMED_VALUE,
               format_validation_message(d.name(), text, fmt::format("Cannot convert to type '{}'", d.type_name())));
        return;
    }
    target.assign(field, std::move(*value), d, s);
}

}
