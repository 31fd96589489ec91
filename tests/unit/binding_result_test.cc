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

#define BOOST_TEST_MODULE binding_result

#include <boost/test/unit_test.hpp>
#include <reqbind/http/binding_result.hh>

#include <fmt/format.h>
#include <json/json.h>

using namespace reqbind;
using namespace reqbind::httpd;

BOOST_AUTO_TEST_CASE(test_empty_result_is_valid) {
    binding_result result;
    BOOST_CHECK(result.is_valid());
    BOOST_CHECK(result.errors().empty());
    BOOST_CHECK_EQUAL(result.to_json_string(), "[]");
    BOOST_CHECK_EQUAL(fmt::format("{}", result), "valid");
}

BOOST_AUTO_TEST_CASE(test_errors_keep_order) {
    binding_result result;
    result.add_error("id", "path", binding_error_kind::MALFORMED_VALUE, "Cannot convert to type 'int64'");
    result.add_error(binding_error{"X-Request-Id", "header", binding_error_kind::MISSING_REQUIRED, "is required"});

    BOOST_CHECK(!result.is_valid());
    BOOST_REQUIRE_EQUAL(result.errors().size(), 2u);
    BOOST_CHECK_EQUAL(result.errors()[0].name, "id");
    BOOST_CHECK(result.errors()[1].kind == binding_error_kind::MISSING_REQUIRED);
}

BOOST_AUTO_TEST_CASE(test_json_report) {
    binding_result result;
    result.add_error("limit", "query", binding_error_kind::MALFORMED_VALUE, "bad");

    auto json = result.to_json();
    BOOST_REQUIRE(json.isArray());
    BOOST_REQUIRE_EQUAL(json.size(), 1u);
    BOOST_CHECK_EQUAL(json[0]["name"].asString(), "limit");
    BOOST_CHECK_EQUAL(json[0]["in"].asString(), "query");
    BOOST_CHECK_EQUAL(json[0]["kind"].asString(), "malformed-value");
    BOOST_CHECK_EQUAL(json[0]["message"].asString(), "bad");

    BOOST_CHECK_EQUAL(result.to_json_string(),
            R"([{"in":"query","kind":"malformed-value","message":"bad","name":"limit"}])");
}

BOOST_AUTO_TEST_CASE(test_formatting) {
    binding_result result;
    result.add_error("tags", "query", binding_error_kind::MALFORMED_COLLECTION, "item 1: bad");
    result.add_error("body", "body", binding_error_kind::DECODE_FAILURE, "broken");
    BOOST_CHECK_EQUAL(fmt::format("{}", result.errors()[0]), "tags (query) malformed-collection: item 1: bad");
    BOOST_CHECK_EQUAL(fmt::format("{}", result),
            "2 binding error(s); tags (query) malformed-collection: item 1: bad; body (body) decode-failure: broken");
}

BOOST_AUTO_TEST_CASE(test_kind_names) {
    BOOST_CHECK_EQUAL(to_string(binding_error_kind::MISSING_REQUIRED), "missing-required");
    BOOST_CHECK_EQUAL(to_string(binding_error_kind::UNSUPPORTED_MEDIA_TYPE), "unsupported-media-type");
    BOOST_CHECK_EQUAL(to_string(binding_error_kind::CONFIGURATION_ERROR), "configuration-error");
}

BOOST_AUTO_TEST_CASE(test_scope_names) {
    binding_result result;
    binding_scope top(result, "friends", "body");
    auto nested = top.element(1).member("name");
    BOOST_CHECK_EQUAL(nested.name(), "friends[1].name");
    BOOST_CHECK_EQUAL(nested.in(), "body");

    binding_scope root(result, "", "body");
    BOOST_CHECK_EQUAL(root.member("id").name(), "id");

    nested.fail(binding_error_kind::MALFORMED_VALUE, "bad");
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK_EQUAL(result.errors()[0].name, "friends[1].name");
}
