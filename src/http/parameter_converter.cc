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

#include <reqbind/http/parameter_converter.hh>
#include <reqbind/http/collection_format.hh>
#include <fmt/format.h>
#include <cmath>
#include <limits>
#include <utility>

namespace reqbind::httpd {

std::string_view bound_value::kind_name() const noexcept {
    return std::visit([] <typename T> (const T&) -> std::string_view {
        if constexpr (std::same_as<T, file_upload>) {
            return "file";
        } else if constexpr (std::same_as<T, bound_list>) {
            return "list";
        } else if constexpr (std::same_as<T, generic_value>) {
            return "object";
        } else {
            return type_name<T>();
        }
    }, value);
}

namespace {

template <typename T>
std::optional<bound_value> convert_as(std::string_view text) {
    auto v = parameter_converter<T>::convert(text);
    if (!v) {
        return std::nullopt;
    }
    return bound_value(std::move(*v));
}

template <IntegralParameter T>
std::optional<bound_value> narrow_integer(int64_t v) {
    if (!std::in_range<T>(v)) {
        return std::nullopt;
    }
    return bound_value(static_cast<T>(v));
}

template <IntegralParameter T>
std::optional<bound_value> narrow_integer(double v) {
    // only integral reals that fit the declared width
    if (!std::isfinite(v) || std::trunc(v) != v
            || v < double(std::numeric_limits<T>::min()) || v >= -double(std::numeric_limits<T>::min())) {
        return std::nullopt;
    }
    return bound_value(static_cast<T>(v));
}

std::optional<bound_value> to_number(const parameter_descriptor& d, double v) {
    if (d.effective_format() == parameter_format::FLOAT) {
        if (std::isfinite(v) && std::abs(v) > double(std::numeric_limits<float>::max())) {
            return std::nullopt;
        }
        return bound_value(static_cast<float>(v));
    }
    return bound_value(v);
}

}

std::optional<bound_value> coerce_text(const parameter_descriptor& d, std::string_view text) {
    switch (d.type()) {
    case parameter_type::STRING:
        switch (d.format()) {
        case parameter_format::DATE:
            return convert_as<date>(text);
        case parameter_format::DATE_TIME:
            return convert_as<date_time>(text);
        case parameter_format::BYTE:
            return convert_as<bytes>(text);
        default:
            return convert_as<sstring>(text);
        }
    case parameter_type::INTEGER:
        if (d.effective_format() == parameter_format::INT32) {
            return convert_as<int32_t>(text);
        }
        return convert_as<int64_t>(text);
    case parameter_type::NUMBER:
        if (d.effective_format() == parameter_format::FLOAT) {
            return convert_as<float>(text);
        }
        return convert_as<double>(text);
    case parameter_type::BOOLEAN:
        return convert_as<bool>(text);
    default:
        return std::nullopt;
    }
}

std::optional<bound_value> coerce_generic(const parameter_descriptor& d, const generic_value& v, sstring& reason) {
    auto mismatch = [&] {
        reason = fmt::format("expected {}, got {}", d.type_name(), to_string(v.type()));
        return std::nullopt;
    };
    auto invalid = [&] (std::string_view what) {
        reason = fmt::format("Cannot convert {} to type '{}'", what, d.type_name());
        return std::nullopt;
    };

    if (auto s = v.get_if<sstring>()) {
        switch (d.type()) {
        case parameter_type::STRING:
        case parameter_type::INTEGER:
        case parameter_type::NUMBER:
        case parameter_type::BOOLEAN:
            if (auto r = coerce_text(d, *s)) {
                return r;
            }
            return invalid(fmt::format("'{}'", *s));
        case parameter_type::ARRAY:
            if (!d.items()) {
                reason = "array without an item descriptor";
                return std::nullopt;
            }
            if (d.collection() != collection_format::MULTI) {
                // a delimited string, e.g. a default of "a,b,c"
                bound_list list;
                size_t i = 0;
                for (auto&& item : split_collection(*s, d.collection())) {
                    sstring item_reason;
                    auto r = coerce_generic(*d.items(), generic_value(item), item_reason);
                    if (!r) {
                        reason = fmt::format("item {}: {}", i, item_reason);
                        return std::nullopt;
                    }
                    list.push_back(std::move(*r));
                    ++i;
                }
                return bound_value(std::move(list));
            }
            return mismatch();
        default:
            return mismatch();
        }
    }

    switch (d.type()) {
    case parameter_type::STRING:
        return mismatch();
    case parameter_type::INTEGER: {
        bool int32 = d.effective_format() == parameter_format::INT32;
        if (auto i = v.get_if<int64_t>()) {
            auto r = int32 ? narrow_integer<int32_t>(*i) : narrow_integer<int64_t>(*i);
            if (!r) {
                return invalid(fmt::to_string(*i));
            }
            return r;
        }
        if (auto f = v.get_if<double>()) {
            auto r = int32 ? narrow_integer<int32_t>(*f) : narrow_integer<int64_t>(*f);
            if (!r) {
                return invalid(fmt::to_string(*f));
            }
            return r;
        }
        return mismatch();
    }
    case parameter_type::NUMBER:
        if (auto i = v.get_if<int64_t>()) {
            return to_number(d, double(*i));
        }
        if (auto f = v.get_if<double>()) {
            auto r = to_number(d, *f);
            if (!r) {
                return invalid(fmt::to_string(*f));
            }
            return r;
        }
        return mismatch();
    case parameter_type::BOOLEAN:
        if (auto b = v.get_if<bool>()) {
            return bound_value(*b);
        }
        return mismatch();
    case parameter_type::ARRAY: {
        auto arr = v.get_if<generic_array>();
        if (!arr) {
            return mismatch();
        }
        if (!d.items()) {
            reason = "array without an item descriptor";
            return std::nullopt;
        }
        bound_list list;
        list.reserve(arr->size());
        for (size_t i = 0; i < arr->size(); ++i) {
            sstring item_reason;
            auto r = coerce_generic(*d.items(), (*arr)[i], item_reason);
            if (!r) {
                reason = fmt::format("item {}: {}", i, item_reason);
                return std::nullopt;
            }
            list.push_back(std::move(*r));
        }
        return bound_value(std::move(list));
    }
    case parameter_type::OBJECT:
        if (v.type() != generic_value::kind::object) {
            return mismatch();
        }
        // mapped onto the destination member by member
        return bound_value(v);
    case parameter_type::FILE:
        reason = "a file cannot be given as a value";
        return std::nullopt;
    }
    return mismatch();
}

}
