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
#include <reqbind/http/generic_value.hh>
#include <reqbind/http/parameter_exception.hh>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace reqbind::httpd {

/// Enumeration of declared parameter types
enum class parameter_type {
    STRING,
    INTEGER,
    NUMBER,
    BOOLEAN,
    ARRAY,
    OBJECT,
    FILE
};

/// Refines a parameter_type, e.g. INTEGER with INT32
enum class parameter_format {
    NONE,
    INT32,
    INT64,
    FLOAT,
    DOUBLE,
    DATE,
    DATE_TIME,
    BYTE
};

/// Enumeration of parameter locations
enum class parameter_location {
    PATH,   ///< Path template parameter
    QUERY,  ///< Query string parameter
    HEADER, ///< Header field
    FORM,   ///< Url-encoded or multipart form field
    FILE,   ///< Multipart file part
    BODY    ///< The decoded request body
};

/// How the items of an array travel in a single text value
enum class collection_format {
    CSV,    ///< a,b,c
    SSV,    ///< a b c
    TSV,    ///< tab separated
    PIPES,  ///< a|b|c
    MULTI   ///< one query parameter occurrence per item
};

// Wire names, as used in descriptor documents and error reports
std::string_view to_string(parameter_type t) noexcept;
std::string_view to_string(parameter_format f) noexcept;
std::string_view to_string(parameter_location l) noexcept;
std::string_view to_string(collection_format c) noexcept;

std::optional<parameter_type> parse_parameter_type(std::string_view s) noexcept;
std::optional<parameter_format> parse_parameter_format(std::string_view s) noexcept;
std::optional<parameter_location> parse_parameter_location(std::string_view s) noexcept;
std::optional<collection_format> parse_collection_format(std::string_view s) noexcept;

std::ostream& operator<<(std::ostream& os, parameter_type t);
std::ostream& operator<<(std::ostream& os, parameter_format f);
std::ostream& operator<<(std::ostream& os, parameter_location l);
std::ostream& operator<<(std::ostream& os, collection_format c);

/// Describes one expected input of an operation: where it is read from,
/// what it must convert to, and what happens when it is missing
class parameter_descriptor {
    sstring _name;
    sstring _in;
    std::optional<parameter_location> _location;
    parameter_type _type;
    parameter_format _format = parameter_format::NONE;
    collection_format _collection_format = collection_format::CSV;
    std::unique_ptr<parameter_descriptor> _items;
    std::vector<std::pair<sstring, parameter_descriptor>> _properties;
    bool _required;
    std::optional<generic_value> _default_value;

public:
    parameter_descriptor(sstring name,
                         parameter_location location,
                         parameter_type type,
                         bool required = false);

    /// Location given by its wire name. An unrecognized location is kept
    /// and reported when the descriptor is bound.
    parameter_descriptor(sstring name,
                         sstring in,
                         parameter_type type,
                         bool required = false);

    // Copy constructor - deep copy of the item descriptor
    parameter_descriptor(const parameter_descriptor& other);

    // Copy assignment
    parameter_descriptor& operator=(const parameter_descriptor& other);

    // Move constructor and assignment
    parameter_descriptor(parameter_descriptor&&) noexcept = default;
    parameter_descriptor& operator=(parameter_descriptor&&) noexcept = default;

    /// Returns *this for method chaining
    parameter_descriptor& with_format(parameter_format format);

    /// Returns *this for method chaining
    parameter_descriptor& with_collection_format(collection_format format);

    /// Set the descriptor of array items
    /// Returns *this for method chaining
    parameter_descriptor& with_items(parameter_descriptor items);

    /// Declare a member of an object value, bound into destination field \c field.
    /// Throws binding_configuration_exception if \c field was already declared.
    /// Returns *this for method chaining
    parameter_descriptor& with_property(sstring field, parameter_descriptor property);

    /// Returns *this for method chaining
    parameter_descriptor& with_required(bool required = true);

    /// Set a default value, used when the parameter is absent
    /// Returns *this for method chaining
    parameter_descriptor& with_default(generic_value default_value);

    // Accessors
    const sstring& name() const noexcept { return _name; }
    /// Location as written, e.g. "query"
    const sstring& in() const noexcept { return _in; }
    /// std::nullopt for an unrecognized location
    const std::optional<parameter_location>& location() const noexcept { return _location; }
    parameter_type type() const noexcept { return _type; }
    parameter_format format() const noexcept { return _format; }
    collection_format collection() const noexcept { return _collection_format; }
    const parameter_descriptor* items() const noexcept { return _items.get(); }
    const std::vector<std::pair<sstring, parameter_descriptor>>& properties() const noexcept {
        return _properties;
    }
    bool required() const noexcept { return _required; }
    const std::optional<generic_value>& default_value() const noexcept {
        return _default_value;
    }

    /// The format a value is converted with: an INTEGER without format is
    /// an INT64, a NUMBER without format a DOUBLE
    parameter_format effective_format() const noexcept;

    /// Type name used in conversion messages, e.g. "int32" or "date-time"
    std::string_view type_name() const noexcept;
};

/// Registry of parameter descriptors of an operation, keyed by the
/// destination field each descriptor binds into.
/// Iteration follows registration order.
class parameter_registry {
    std::vector<std::pair<sstring, parameter_descriptor>> _params;

public:
    /// Register the descriptor of destination field \c field
    /// Throws binding_configuration_exception if the field is already registered
    void register_parameter(sstring field, parameter_descriptor descriptor);

    /// Get the descriptor of a destination field
    /// Returns nullptr if no descriptor exists for the field
    const parameter_descriptor* get_descriptor(std::string_view field) const;

    /// Check if a descriptor exists for the field
    bool has_descriptor(std::string_view field) const;

    size_t size() const noexcept { return _params.size(); }

    auto begin() const noexcept { return _params.begin(); }
    auto end() const noexcept { return _params.end(); }
};

} // namespace reqbind::httpd

template <>
struct fmt::formatter<reqbind::httpd::parameter_location> : fmt::formatter<std::string_view> {
    auto format(reqbind::httpd::parameter_location l, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(to_string(l), ctx);
    }
};

template <>
struct fmt::formatter<reqbind::httpd::parameter_type> : fmt::formatter<std::string_view> {
    auto format(reqbind::httpd::parameter_type t, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(to_string(t), ctx);
    }
};

template <>
struct fmt::formatter<reqbind::httpd::collection_format> : fmt::formatter<std::string_view> {
    auto format(reqbind::httpd::collection_format c, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(to_string(c), ctx);
    }
};
