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
#include <reqbind/http/url.hh>

#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace reqbind {

namespace http {

/**
 * Named values extracted from a matched path template, e.g. `{id}` in
 * `/pets/{id}`, in the order the template declares them.
 *
 * Values are kept as they appeared in the path (still percent encoded);
 * get_decoded_param() decodes them.
 */
class route_params {
    std::vector<std::pair<sstring, sstring>> params;
public:
    route_params() = default;
    route_params(std::initializer_list<std::pair<sstring, sstring>> init)
        : params(init) {}

    const sstring* find(std::string_view key) const {
        for (auto&& p : params) {
            if (p.first == key) {
                return &p.second;
            }
        }
        return nullptr;
    }

    const sstring& at(std::string_view key) const {
        auto v = find(key);
        if (!v) {
            throw std::out_of_range(sstring("no route parameter ") + sstring(key));
        }
        return *v;
    }

    /**
     * @return the path decoded value, or std::nullopt if the parameter
     *  does not exist or cannot be path decoded
     */
    std::optional<sstring> get_decoded_param(std::string_view key) const {
        auto raw = find(key);
        if (!raw) {
            return std::nullopt;
        }
        sstring decoded;
        if (!internal::path_decode(*raw, decoded)) {
            return std::nullopt;
        }
        return decoded;
    }

    bool exists(std::string_view key) const {
        return find(key) != nullptr;
    }

    void set(const sstring& key, const sstring& value) {
        for (auto& p : params) {
            if (p.first == key) {
                p.second = value;
                return;
            }
        }
        params.emplace_back(key, value);
    }

    void clear() {
        params.clear();
    }

    size_t size() const noexcept {
        return params.size();
    }

    auto begin() const noexcept {
        return params.begin();
    }

    auto end() const noexcept {
        return params.end();
    }
};

}

}
