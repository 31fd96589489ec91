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

#include <reqbind/util/base64.hh>

#include <gnutls/gnutls.h>
#include <fmt/format.h>

#include <stdexcept>

namespace reqbind::util {

namespace {

class gnutls_datum_holder {
    gnutls_datum_t _datum{nullptr, 0};
public:
    gnutls_datum_holder() = default;
    gnutls_datum_holder(const gnutls_datum_holder&) = delete;
    gnutls_datum_holder& operator=(const gnutls_datum_holder&) = delete;
    ~gnutls_datum_holder() {
        gnutls_free(_datum.data);
    }
    gnutls_datum_t* get() noexcept { return &_datum; }
    std::string_view view() const noexcept {
        return std::string_view(reinterpret_cast<const char*>(_datum.data), _datum.size);
    }
};

gnutls_datum_t as_datum(std::string_view source) noexcept {
    return gnutls_datum_t{
        .data = reinterpret_cast<uint8_t*>(const_cast<char*>(source.data())),
        .size = static_cast<unsigned>(source.size())
    };
}

bool is_base64_char(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

// gnutls tolerates embedded newlines and missing padding; the wire format
// here is a single padded line.
bool is_canonical_base64(std::string_view s) noexcept {
    if (s.size() % 4 != 0) {
        return false;
    }
    size_t padding = 0;
    while (padding < 2 && padding < s.size() && s[s.size() - 1 - padding] == '=') {
        ++padding;
    }
    for (size_t i = 0; i < s.size() - padding; ++i) {
        if (!is_base64_char(s[i])) {
            return false;
        }
    }
    return true;
}

}

std::string base64_encode(std::string_view source) {
    if (source.empty()) {
        return {};
    }
    auto src_data = as_datum(source);
    gnutls_datum_holder encoded;
    if (int ret = gnutls_base64_encode2(&src_data, encoded.get()); ret != GNUTLS_E_SUCCESS) {
        throw std::runtime_error(fmt::format("gnutls_base64_encode2: {}", gnutls_strerror(ret)));
    }
    return std::string(encoded.view());
}

std::optional<std::vector<uint8_t>> base64_decode(std::string_view source) {
    if (source.empty()) {
        return std::vector<uint8_t>{};
    }
    if (!is_canonical_base64(source)) {
        return std::nullopt;
    }
    auto src_data = as_datum(source);
    gnutls_datum_holder decoded;
    if (gnutls_base64_decode2(&src_data, decoded.get()) != GNUTLS_E_SUCCESS) {
        return std::nullopt;
    }
    auto view = decoded.view();
    return std::vector<uint8_t>(view.begin(), view.end());
}

}
