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

#include <reqbind/http/common.hh>
#include <reqbind/http/consumer.hh>
#include <reqbind/http/descriptor_loader.hh>
#include <reqbind/http/field_map.hh>
#include <reqbind/http/request.hh>
#include <reqbind/http/request_binder.hh>
#include <reqbind/util/log.hh>
#include <reqbind/util/log-cli.hh>

#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace reqbind;
using namespace reqbind::httpd;
namespace bpo = boost::program_options;

static logger dlogger("request_binding_demo");

// Accepts every field and keeps what was bound, for printing
class record_target final : public binding_target {
    std::map<sstring, sstring> _values;
public:
    bool has_field(std::string_view) const override {
        return true;
    }

    bool assign(std::string_view field, bound_value&& v, const parameter_descriptor&, const binding_scope&) override {
        _values[sstring(field)] = describe(v);
        return true;
    }

    const std::map<sstring, sstring>& values() const noexcept {
        return _values;
    }
private:
    static sstring describe(bound_value& v) {
        return std::visit([] <typename T> (T& x) -> sstring {
            if constexpr (std::same_as<T, bytes>) {
                return fmt::format("{} byte(s)", x.size());
            } else if constexpr (std::same_as<T, file_upload>) {
                auto content = x.data.read_all("file part");
                return fmt::format("file '{}' ({}, {} byte(s))", x.filename, x.content_type, content.size());
            } else if constexpr (std::same_as<T, bound_list>) {
                std::vector<sstring> items;
                for (auto& e : x) {
                    items.push_back(describe(e));
                }
                return fmt::format("[{}]", fmt::join(items, ", "));
            } else {
                return fmt::format("{}", x);
            }
        }, v.value);
    }
};

int main(int ac, char** av) {
    bpo::options_description opts("request_binding_demo options");
    opts.add_options()
            ("help", "show this help message")
            ("descriptors", bpo::value<std::string>(), "YAML file with the parameter descriptors")
            ("method", bpo::value<std::string>()->default_value("GET"), "request method")
            ("url", bpo::value<std::string>()->default_value("/"), "request url, query string included")
            ("header", bpo::value<std::vector<std::string>>()->composing(), "request header, as 'Name: value'")
            ("route", bpo::value<std::vector<std::string>>()->composing(), "path parameter, as 'name=value'")
            ("content-type", bpo::value<std::string>(), "Content-Type of the body")
            ("body", bpo::value<std::string>(), "request body")
    ;
    opts.add(log_cli::get_options_description());

    bpo::variables_map config;
    try {
        bpo::store(bpo::parse_command_line(ac, av, opts), config);
        bpo::notify(config);
    } catch (const bpo::error& e) {
        std::cerr << e.what() << "\n" << opts << "\n";
        return 2;
    }
    if (config["help-loggers"].as<bool>()) {
        log_cli::print_available_loggers(std::cout);
        return 0;
    }
    if (config.count("help") || !config.count("descriptors")) {
        std::cout << opts << "\n";
        return config.count("help") ? 0 : 2;
    }
    try {
        apply_logging_settings(log_cli::extract_settings(config));

        auto registry = load_parameter_registry_file(config["descriptors"].as<std::string>());
        dlogger.info("loaded {} parameter descriptor(s)", registry.size());
        binder_core binder(std::move(registry));

        auto req = http::request::make(config["method"].as<std::string>(), "localhost", config["url"].as<std::string>());
        if (config.count("header")) {
            for (auto&& h : config["header"].as<std::vector<std::string>>()) {
                auto colon = h.find(':');
                if (colon == std::string::npos) {
                    dlogger.error("ignoring malformed header '{}'", h);
                    continue;
                }
                req._headers[h.substr(0, colon)] = sstring(reqbind::internal::trim(std::string_view(h).substr(colon + 1)));
            }
        }
        if (config.count("body")) {
            auto ct = config.count("content-type") ? config["content-type"].as<std::string>() : std::string(http::mime_types::json);
            req.write_body(ct, config["body"].as<std::string>());
        }

        http::route_params route;
        if (config.count("route")) {
            for (auto&& r : config["route"].as<std::vector<std::string>>()) {
                log_cli::parse_map_associations(r, [&route] (std::string name, std::string value) {
                    route.set(name, value);
                });
            }
        }

        record_target target;
        auto result = binder.bind(req, route, json_consumer(), target);
        for (auto&& [field, value] : target.values()) {
            fmt::print("{} = {}\n", field, value);
        }
        fmt::print("{}\n", result.to_json_string());
        return result.is_valid() ? 0 : 1;
    } catch (const binding_configuration_exception& e) {
        dlogger.error("{}", e.what());
        return 2;
    } catch (const bpo::error& e) {
        dlogger.error("{}", e.what());
        return 2;
    } catch (const std::runtime_error& e) {
        dlogger.error("{}", e.what());
        return 2;
    }
}
