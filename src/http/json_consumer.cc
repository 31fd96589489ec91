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

#include <reqbind/http/consumer.hh>
#include <reqbind/http/parameter_exception.hh>

#include <json/json.h>
#include <limits>
#include <memory>

namespace reqbind::httpd {

namespace {

generic_value from_json(const Json::Value& v) {
    switch (v.type()) {
    case Json::nullValue:
        return generic_value();
    case Json::booleanValue:
        return generic_value(v.asBool());
    case Json::intValue:
        return generic_value(int64_t(v.asInt64()));
    case Json::uintValue:
        if (v.asUInt64() > uint64_t(std::numeric_limits<int64_t>::max())) {
            return generic_value(v.asDouble());
        }
        return generic_value(int64_t(v.asInt64()));
    case Json::realValue:
        return generic_value(v.asDouble());
    case Json::stringValue:
        return generic_value(sstring(v.asString()));
    case Json::arrayValue: {
        generic_array arr;
        arr.reserve(v.size());
        for (auto&& e : v) {
            arr.push_back(from_json(e));
        }
        return generic_value(std::move(arr));
    }
    case Json::objectValue: {
        generic_object obj;
        for (auto&& name : v.getMemberNames()) {
            obj.emplace_back(name, from_json(v[name]));
        }
        return generic_value(std::move(obj));
    }
    }
    return generic_value();
}

}

bool json_consumer::supports(const http::media_type& mt) const {
    return mt.is(http::mime_types::json) || mt.has_suffix("json");
}

generic_value json_consumer::consume(http::content_source& body) const {
    auto payload = body.read_all("request body");

    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["allowComments"] = false;
    builder["failIfExtra"] = true;
    builder["allowSpecialFloats"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    if (!reader->parse(payload.data(), payload.data() + payload.size(), &root, &errs)) {
        throw decode_exception(sstring(http::mime_types::json), errs);
    }
    return from_json(root);
}

}
