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

#include <reqbind/http/descriptor_loader.hh>
#include <reqbind/http/parameter_exception.hh>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <istream>
#include <iterator>
#include <string>

/// YAML parsing functions
namespace YAML {
template <>
struct convert<reqbind::httpd::generic_value> {
    static bool
    decode(const Node& node, reqbind::httpd::generic_value& value) {
        using reqbind::httpd::generic_value;
        switch (node.Type()) {
        case NodeType::Null:
        case NodeType::Undefined:
            value = generic_value();
            return true;
        case NodeType::Sequence: {
            reqbind::httpd::generic_array arr;
            for (auto&& item : node) {
                arr.push_back(item.as<generic_value>());
            }
            value = generic_value(std::move(arr));
            return true;
        }
        case NodeType::Map: {
            reqbind::httpd::generic_object obj;
            for (auto&& item : node) {
                obj.emplace_back(item.first.as<std::string>(), item.second.as<generic_value>());
            }
            value = generic_value(std::move(obj));
            return true;
        }
        case NodeType::Scalar:
            break;
        }

        // quoted scalars are strings, plain ones are typed by their text
        if (node.Tag() != "!") {
            int64_t i;
            if (convert<int64_t>::decode(node, i)) {
                value = generic_value(i);
                return true;
            }
            double d;
            if (convert<double>::decode(node, d)) {
                value = generic_value(d);
                return true;
            }
            bool b;
            if (convert<bool>::decode(node, b)) {
                value = generic_value(b);
                return true;
            }
            if (node.Scalar() == "~" || node.Scalar() == "null") {
                value = generic_value();
                return true;
            }
        }
        value = generic_value(reqbind::sstring(node.Scalar()));
        return true;
    }
};
}

namespace reqbind::httpd {

namespace {

// list of supported descriptor keys
const std::string descriptor_keys[]{ "field", "name", "in", "type", "format", "collectionFormat", "items", "properties", "required", "default" };

sstring required_key(const YAML::Node& node, const char* key, const sstring& field) {
    if (!node[key]) {
        throw descriptor_config_exception(field, fmt::format("missing key '{}'", key));
    }
    return node[key].as<std::string>();
}

// parent_in, parent_name: inherited by array items, empty at the top level.
// field is set to the destination field of the parameter when empty.
parameter_descriptor parse_descriptor(const YAML::Node& node, const sstring& parent_in, const sstring& parent_name, sstring& field) {
    if (!node.IsMap()) {
        throw descriptor_config_exception(field, "a parameter must be a mapping");
    }

    // test for unsupported key
    for (auto&& item : node) {
        auto key = item.first.as<std::string>();
        if (std::none_of(std::begin(descriptor_keys), std::end(descriptor_keys), [&key] (const std::string& s) { return s == key; })) {
            throw descriptor_config_exception(field, fmt::format("unsupported key '{}'", key));
        }
    }

    auto name = node["name"] || parent_name.empty() ? required_key(node, "name", field) : parent_name;
    if (field.empty()) {
        field = node["field"] ? node["field"].as<std::string>() : name;
    }
    auto in = node["in"] ? sstring(node["in"].as<std::string>()) : parent_in;
    if (in.empty()) {
        throw descriptor_config_exception(field, "missing key 'in'");
    }

    auto type_name = required_key(node, "type", field);
    auto type = parse_parameter_type(type_name);
    if (!type) {
        throw descriptor_config_exception(field, fmt::format("unknown type '{}'", type_name));
    }

    parameter_descriptor d(name, in, *type);

    if (node["format"]) {
        auto format_name = node["format"].as<std::string>();
        auto format = parse_parameter_format(format_name);
        if (!format) {
            throw descriptor_config_exception(field, fmt::format("unknown format '{}'", format_name));
        }
        d.with_format(*format);
    }

    if (node["collectionFormat"]) {
        auto cf_name = node["collectionFormat"].as<std::string>();
        auto cf = parse_collection_format(cf_name);
        if (!cf) {
            throw descriptor_config_exception(field, fmt::format("unknown collection format '{}'", cf_name));
        }
        d.with_collection_format(*cf);
    }

    if (node["items"]) {
        sstring items_field = field;
        d.with_items(parse_descriptor(node["items"], in, name, items_field));
    } else if (*type == parameter_type::ARRAY) {
        throw descriptor_config_exception(field, "array parameter without 'items'");
    }

    if (node["properties"]) {
        if (!node["properties"].IsSequence()) {
            throw descriptor_config_exception(field, "'properties' must be a sequence");
        }
        for (auto&& property : node["properties"]) {
            sstring property_field;
            auto child = parse_descriptor(property, in, "", property_field);
            d.with_property(std::move(property_field), std::move(child));
        }
    }

    if (node["required"]) {
        d.with_required(node["required"].as<bool>());
    }

    if (node["default"]) {
        d.with_default(node["default"].as<generic_value>());
    }
    return d;
}

}

parameter_registry load_parameter_registry(std::istream& input) {
    parameter_registry registry;
    try {
        YAML::Node doc = YAML::Load(input);
        if (!doc || doc.IsNull()) {
            return registry;
        }
        if (!doc.IsSequence()) {
            throw descriptor_config_exception("", "the document must be a sequence of parameters");
        }
        for (auto&& item : doc) {
            sstring field;
            auto d = parse_descriptor(item, "", "", field);
            registry.register_parameter(std::move(field), std::move(d));
        }
    } catch (const YAML::Exception& e) {
        throw descriptor_config_exception("", e.what());
    }
    return registry;
}

parameter_registry load_parameter_registry_file(const sstring& path) {
    std::ifstream input(path);
    if (!input) {
        throw descriptor_config_exception("", fmt::format("cannot open '{}'", path));
    }
    return load_parameter_registry(input);
}

}
