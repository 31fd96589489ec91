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

#include <reqbind/http/parameter_metadata.hh>
#include <fmt/format.h>
#include <algorithm>
#include <iterator>
#include <ostream>

namespace reqbind::httpd {

namespace {

template <typename Enum, size_t N>
std::optional<Enum> lookup(const std::pair<std::string_view, Enum> (&names)[N], std::string_view s) noexcept {
    auto it = std::find_if(std::begin(names), std::end(names), [s] (auto& p) { return p.first == s; });
    if (it == std::end(names)) {
        return std::nullopt;
    }
    return it->second;
}

const std::pair<std::string_view, parameter_type> type_names[] = {
    {"string", parameter_type::STRING},
    {"integer", parameter_type::INTEGER},
    {"number", parameter_type::NUMBER},
    {"boolean", parameter_type::BOOLEAN},
    {"array", parameter_type::ARRAY},
    {"object", parameter_type::OBJECT},
    {"file", parameter_type::FILE},
};

const std::pair<std::string_view, parameter_format> format_names[] = {
    {"", parameter_format::NONE},
    {"int32", parameter_format::INT32},
    {"int64", parameter_format::INT64},
    {"float", parameter_format::FLOAT},
    {"double", parameter_format::DOUBLE},
    {"date", parameter_format::DATE},
    {"date-time", parameter_format::DATE_TIME},
    {"byte", parameter_format::BYTE},
};

// "formData" is the name used by swagger 2 documents
const std::pair<std::string_view, parameter_location> location_names[] = {
    {"path", parameter_location::PATH},
    {"query", parameter_location::QUERY},
    {"header", parameter_location::HEADER},
    {"formData", parameter_location::FORM},
    {"form", parameter_location::FORM},
    {"file", parameter_location::FILE},
    {"body", parameter_location::BODY},
};

const std::pair<std::string_view, collection_format> collection_names[] = {
    {"csv", collection_format::CSV},
    {"ssv", collection_format::SSV},
    {"tsv", collection_format::TSV},
    {"pipes", collection_format::PIPES},
    {"multi", collection_format::MULTI},
};

template <typename Enum, size_t N>
std::string_view name_of(const std::pair<std::string_view, Enum> (&names)[N], Enum e) noexcept {
    for (auto&& [name, value] : names) {
        if (value == e) {
            return name;
        }
    }
    return "unknown";
}

}

std::string_view to_string(parameter_type t) noexcept {
    return name_of(type_names, t);
}

std::string_view to_string(parameter_format f) noexcept {
    return name_of(format_names, f);
}

std::string_view to_string(parameter_location l) noexcept {
    return name_of(location_names, l);
}

std::string_view to_string(collection_format c) noexcept {
    return name_of(collection_names, c);
}

std::optional<parameter_type> parse_parameter_type(std::string_view s) noexcept {
    return lookup(type_names, s);
}

std::optional<parameter_format> parse_parameter_format(std::string_view s) noexcept {
    return lookup(format_names, s);
}

std::optional<parameter_location> parse_parameter_location(std::string_view s) noexcept {
    return lookup(location_names, s);
}

std::optional<collection_format> parse_collection_format(std::string_view s) noexcept {
    return lookup(collection_names, s);
}

std::ostream& operator<<(std::ostream& os, parameter_type t) {
    return os << to_string(t);
}

std::ostream& operator<<(std::ostream& os, parameter_format f) {
    return os << to_string(f);
}

std::ostream& operator<<(std::ostream& os, parameter_location l) {
    return os << to_string(l);
}

std::ostream& operator<<(std::ostream& os, collection_format c) {
    return os << to_string(c);
}

// parameter_descriptor implementation

parameter_descriptor::parameter_descriptor(sstring name,
                                           parameter_location location,
                                           parameter_type type,
                                           bool required)
    : _name(std::move(name))
    , _in(to_string(location))
    , _location(location)
    , _type(type)
    , _required(required) {
}

parameter_descriptor::parameter_descriptor(sstring name,
                                           sstring in,
                                           parameter_type type,
                                           bool required)
    : _name(std::move(name))
    , _in(std::move(in))
    , _location(parse_parameter_location(_in))
    , _type(type)
    , _required(required) {
}

parameter_descriptor::parameter_descriptor(const parameter_descriptor& other)
    : _name(other._name)
    , _in(other._in)
    , _location(other._location)
    , _type(other._type)
    , _format(other._format)
    , _collection_format(other._collection_format)
    , _items(other._items ? std::make_unique<parameter_descriptor>(*other._items) : nullptr)
    , _properties(other._properties)
    , _required(other._required)
    , _default_value(other._default_value) {
}

parameter_descriptor& parameter_descriptor::operator=(const parameter_descriptor& other) {
    if (this != &other) {
        _name = other._name;
        _in = other._in;
        _location = other._location;
        _type = other._type;
        _format = other._format;
        _collection_format = other._collection_format;
        _items = other._items ? std::make_unique<parameter_descriptor>(*other._items) : nullptr;
        _properties = other._properties;
        _required = other._required;
        _default_value = other._default_value;
    }
    return *this;
}

parameter_descriptor& parameter_descriptor::with_format(parameter_format format) {
    _format = format;
    return *this;
}

parameter_descriptor& parameter_descriptor::with_collection_format(collection_format format) {
    _collection_format = format;
    return *this;
}

parameter_descriptor& parameter_descriptor::with_items(parameter_descriptor items) {
    _items = std::make_unique<parameter_descriptor>(std::move(items));
    return *this;
}

parameter_descriptor& parameter_descriptor::with_property(sstring field, parameter_descriptor property) {
    auto dup = std::find_if(_properties.begin(), _properties.end(), [&field] (auto& p) { return p.first == field; });
    if (dup != _properties.end()) {
        throw binding_configuration_exception(
            fmt::format("property field '{}' of parameter '{}' is declared twice", field, _name));
    }
    _properties.emplace_back(std::move(field), std::move(property));
    return *this;
}

parameter_descriptor& parameter_descriptor::with_required(bool required) {
    _required = required;
    return *this;
}

parameter_descriptor& parameter_descriptor::with_default(generic_value default_value) {
    _default_value = std::move(default_value);
    return *this;
}

parameter_format parameter_descriptor::effective_format() const noexcept {
    if (_format == parameter_format::NONE) {
        if (_type == parameter_type::INTEGER) {
            return parameter_format::INT64;
        }
        if (_type == parameter_type::NUMBER) {
            return parameter_format::DOUBLE;
        }
    }
    return _format;
}

std::string_view parameter_descriptor::type_name() const noexcept {
    switch (_type) {
    case parameter_type::STRING:
        switch (_format) {
        case parameter_format::DATE:
        case parameter_format::DATE_TIME:
        case parameter_format::BYTE:
            return to_string(_format);
        default:
            return "string";
        }
    case parameter_type::INTEGER:
    case parameter_type::NUMBER:
        return to_string(effective_format());
    default:
        return to_string(_type);
    }
}

// parameter_registry implementation

void parameter_registry::register_parameter(sstring field, parameter_descriptor descriptor) {
    if (has_descriptor(field)) {
        throw binding_configuration_exception(
            fmt::format("field '{}' already has a parameter descriptor", field));
    }
    _params.emplace_back(std::move(field), std::move(descriptor));
}

const parameter_descriptor* parameter_registry::get_descriptor(std::string_view field) const {
    for (auto&& [f, d] : _params) {
        if (f == field) {
            return &d;
        }
    }
    return nullptr;
}

bool parameter_registry::has_descriptor(std::string_view field) const {
    return get_descriptor(field) != nullptr;
}

} // namespace reqbind::httpd
