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

#include <reqbind/http/binding_result.hh>
#include <reqbind/http/common.hh>
#include <reqbind/http/consumer.hh>
#include <reqbind/http/field_map.hh>
#include <reqbind/http/parameter_metadata.hh>
#include <reqbind/http/request.hh>

namespace reqbind::httpd {

class binding_context;

/**
 * Binds the declared parameters of a request into a binding_target.
 *
 * Parameters are handled one at a time, in registration order. A parameter
 * that fails adds an error to the result and binding goes on with the next
 * one, so a single call reports every failure.
 *
 * A binder_core does not change after construction; bind() can run
 * concurrently on distinct requests and destinations.
 */
class binder_core {
    parameter_registry _registry;
public:
    explicit binder_core(parameter_registry registry);

    const parameter_registry& registry() const noexcept {
        return _registry;
    }

    binding_result bind(http::request& req, const http::route_params& route, const consumer& c, binding_target& target) const;
private:
    void bind_parameter(const sstring& field, const parameter_descriptor& d, binding_context& ctx,
                        binding_target& target, binding_result& result) const;
};

/**
 * Binds requests into destinations of type T.
 *
 * \code {.cpp}
 * parameter_registry params;
 * params.register_parameter("id", parameter_descriptor("id", parameter_location::PATH,
 *         parameter_type::INTEGER, true).with_format(parameter_format::INT64));
 * request_binder<pet_params> binder(std::move(params), field_map<pet_params>().add("id", &pet_params::id));
 *
 * pet_params dest;
 * auto result = binder.bind(req, route, json_consumer(), dest);
 * if (!result.is_valid()) {
 *     // reject the request with result.to_json()
 * }
 * \endcode
 */
template <typename T>
class request_binder {
    binder_core _core;
    field_map<T> _fields;
public:
    request_binder(parameter_registry registry, field_map<T> fields)
        : _core(std::move(registry)), _fields(std::move(fields)) {}

    const parameter_registry& registry() const noexcept {
        return _core.registry();
    }

    const field_map<T>& fields() const noexcept {
        return _fields;
    }

    /**
     * Bind \c req into \c dest.
     *
     * The body and file parts of \c req are consumed. \c dest may be partly
     * filled when the result is not valid.
     */
    binding_result bind(http::request& req, const http::route_params& route, const consumer& c, T& dest) const {
        field_target<T> target(_fields, dest);
        return _core.bind(req, route, c, target);
    }
};

}
