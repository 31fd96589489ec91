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

#define BOOST_TEST_MODULE request_binder

#include <boost/test/unit_test.hpp>
#include <reqbind/http/exception.hh>
#include <reqbind/http/request_binder.hh>

#include <cerrno>
#include <memory>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

using namespace reqbind;
using namespace reqbind::httpd;

namespace {

const json_consumer json{};

struct pet_friend {
    sstring name;
    int32_t age = 0;
};

field_map<pet_friend> friend_fields() {
    return field_map<pet_friend>()
            .add("name", &pet_friend::name)
            .add("age", &pet_friend::age);
}

parameter_descriptor string_array(sstring name, parameter_location in, collection_format cf) {
    parameter_descriptor d(name, in, parameter_type::ARRAY);
    d.with_collection_format(cf).with_items(parameter_descriptor(name, in, parameter_type::STRING));
    return d;
}

bool has_error(const binding_result& r, std::string_view name, binding_error_kind kind) {
    for (auto&& e : r.errors()) {
        if (e.name == name && e.kind == kind) {
            return true;
        }
    }
    return false;
}

const sstring upload_body =
        "--boundary\r\n"
        "Content-Disposition: form-data; name=\"name\"\r\n"
        "\r\n"
        "Rex\r\n"
        "--boundary\r\n"
        "Content-Disposition: form-data; name=\"file\"; filename=\"rex.txt\"\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "uploaded bytes\r\n"
        "--boundary--\r\n";

}

struct tag_params {
    std::vector<sstring> tags;
};

BOOST_AUTO_TEST_CASE(test_query_collection_formats) {
    const std::vector<std::pair<collection_format, sstring>> cases{
        {collection_format::CSV, "/pets?tags=one,two,three"},
        {collection_format::SSV, "/pets?tags=one%20two%20three"},
        {collection_format::TSV, "/pets?tags=one%09two%09three"},
        {collection_format::PIPES, "/pets?tags=one|two|three"},
        {collection_format::MULTI, "/pets?tags=one&tags=two&tags=three"},
    };
    for (auto&& [cf, url] : cases) {
        parameter_registry params;
        params.register_parameter("tags", string_array("tags", parameter_location::QUERY, cf));
        request_binder<tag_params> binder(std::move(params), field_map<tag_params>().add("tags", &tag_params::tags));

        auto req = http::request::make("GET", "localhost", url);
        tag_params dest;
        auto result = binder.bind(req, {}, json, dest);
        BOOST_CHECK_MESSAGE(result.is_valid(), fmt::format("{}: {}", cf, result));
        BOOST_CHECK((dest.tags == std::vector<sstring>{"one", "two", "three"}));
    }
}

BOOST_AUTO_TEST_CASE(test_present_but_empty_array) {
    parameter_registry params;
    params.register_parameter("tags", string_array("tags", parameter_location::QUERY, collection_format::CSV));
    request_binder<tag_params> binder(std::move(params), field_map<tag_params>().add("tags", &tag_params::tags));

    auto req = http::request::make("GET", "localhost", "/pets?tags=");
    tag_params dest{{"stale"}};
    auto result = binder.bind(req, {}, json, dest);
    BOOST_CHECK(result.is_valid());
    BOOST_CHECK(dest.tags.empty());

    // a required array with no items
    parameter_registry required_params;
    required_params.register_parameter("tags",
            string_array("tags", parameter_location::QUERY, collection_format::CSV).with_required());
    request_binder<tag_params> strict(std::move(required_params), field_map<tag_params>().add("tags", &tag_params::tags));
    auto empty = http::request::make("GET", "localhost", "/pets?tags=");
    result = strict.bind(empty, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::MISSING_REQUIRED);
}

struct pet_ids_params {
    std::vector<int64_t> ids;
};

BOOST_AUTO_TEST_CASE(test_present_but_empty_multi_array) {
    auto int64_ids = [] {
        parameter_descriptor d("ids", parameter_location::QUERY, parameter_type::ARRAY);
        d.with_collection_format(collection_format::MULTI)
         .with_items(parameter_descriptor("ids", parameter_location::QUERY, parameter_type::INTEGER).with_format(parameter_format::INT64));
        return d;
    };
    parameter_registry params;
    params.register_parameter("ids", int64_ids());
    request_binder<pet_ids_params> binder(std::move(params), field_map<pet_ids_params>().add("ids", &pet_ids_params::ids));

    auto req = http::request::make("GET", "localhost", "/pets?ids=");
    pet_ids_params dest{{7}};
    auto result = binder.bind(req, {}, json, dest);
    BOOST_CHECK_MESSAGE(result.is_valid(), fmt::format("{}", result));
    BOOST_CHECK(dest.ids.empty());

    auto mixed = http::request::make("GET", "localhost", "/pets?ids=&ids=3&ids=");
    result = binder.bind(mixed, {}, json, dest);
    BOOST_CHECK(result.is_valid());
    BOOST_CHECK((dest.ids == std::vector<int64_t>{3}));

    parameter_registry required_params;
    required_params.register_parameter("ids", int64_ids().with_required());
    request_binder<pet_ids_params> strict(std::move(required_params), field_map<pet_ids_params>().add("ids", &pet_ids_params::ids));
    auto empty = http::request::make("GET", "localhost", "/pets?ids=");
    result = strict.bind(empty, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::MISSING_REQUIRED);
}

struct pet_id_params {
    int64_t id = 0;
};

BOOST_AUTO_TEST_CASE(test_path_integer) {
    parameter_registry params;
    params.register_parameter("id", parameter_descriptor("id", parameter_location::PATH, parameter_type::INTEGER, true)
            .with_format(parameter_format::INT64));
    request_binder<pet_id_params> binder(std::move(params), field_map<pet_id_params>().add("id", &pet_id_params::id));

    auto req = http::request::make("GET", "localhost", "/pets/1");
    pet_id_params dest;
    auto result = binder.bind(req, {{"id", "1"}}, json, dest);
    BOOST_CHECK(result.is_valid());
    BOOST_CHECK_EQUAL(dest.id, 1);

    auto bad = http::request::make("GET", "localhost", "/pets/one");
    result = binder.bind(bad, {{"id", "one"}}, json, dest);
    BOOST_CHECK(!result.is_valid());
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    auto& e = result.errors()[0];
    BOOST_CHECK_EQUAL(e.name, "id");
    BOOST_CHECK_EQUAL(e.in, "path");
    BOOST_CHECK(e.kind == binding_error_kind::MALFORMED_VALUE);
    BOOST_CHECK(e.message.find("Cannot convert to type 'int64'") != sstring::npos);

    // the route does not provide the parameter at all
    result = binder.bind(bad, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::CONFIGURATION_ERROR);
}

struct header_params {
    sstring request_id = "unset";
    std::optional<int32_t> rate_limit;
};

BOOST_AUTO_TEST_CASE(test_required_and_optional_headers) {
    parameter_registry params;
    params.register_parameter("request_id", parameter_descriptor("X-Request-Id", parameter_location::HEADER, parameter_type::STRING, true));
    params.register_parameter("rate_limit", parameter_descriptor("X-Rate-Limit", parameter_location::HEADER, parameter_type::INTEGER)
            .with_format(parameter_format::INT32));
    request_binder<header_params> binder(std::move(params), field_map<header_params>()
            .add("request_id", &header_params::request_id)
            .add("rate_limit", &header_params::rate_limit));

    auto req = http::request::make("GET", "localhost", "/");
    header_params dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK_EQUAL(result.errors()[0].name, "X-Request-Id");
    BOOST_CHECK_EQUAL(result.errors()[0].in, "header");
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::MISSING_REQUIRED);
    BOOST_CHECK_EQUAL(dest.request_id, "unset");
    BOOST_CHECK(!dest.rate_limit);

    req._headers["x-request-id"] = "abc";
    req._headers["X-Rate-Limit"] = "100";
    result = binder.bind(req, {}, json, dest);
    BOOST_CHECK(result.is_valid());
    BOOST_CHECK_EQUAL(dest.request_id, "abc");
    BOOST_CHECK_EQUAL(dest.rate_limit.value_or(0), 100);

    req._headers["X-Rate-Limit"] = "9000000000";
    result = binder.bind(req, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::MALFORMED_VALUE);
}

struct default_params {
    bool flag = false;
    int32_t count = 0;
    float ratio = 0;
    sstring name;
    date birthday{};
    date_time last_seen{};
    bytes picture;
    std::vector<sstring> tags;
    pet_friend best_friend;
};

BOOST_AUTO_TEST_CASE(test_defaults_of_absent_parameters) {
    parameter_registry params;
    params.register_parameter("flag", parameter_descriptor("flag", parameter_location::QUERY, parameter_type::BOOLEAN)
            .with_default(true));
    params.register_parameter("count", parameter_descriptor("count", parameter_location::QUERY, parameter_type::INTEGER)
            .with_format(parameter_format::INT32).with_default(3));
    params.register_parameter("ratio", parameter_descriptor("ratio", parameter_location::QUERY, parameter_type::NUMBER)
            .with_format(parameter_format::FLOAT).with_default(0.5));
    params.register_parameter("name", parameter_descriptor("name", parameter_location::HEADER, parameter_type::STRING)
            .with_default("Rex"));
    params.register_parameter("birthday", parameter_descriptor("birthday", parameter_location::QUERY, parameter_type::STRING)
            .with_format(parameter_format::DATE).with_default("2014-08-09"));
    params.register_parameter("last_seen", parameter_descriptor("lastSeen", parameter_location::QUERY, parameter_type::STRING)
            .with_format(parameter_format::DATE_TIME).with_default("2014-10-12T08:05:05Z"));
    params.register_parameter("picture", parameter_descriptor("picture", parameter_location::FORM, parameter_type::STRING)
            .with_format(parameter_format::BYTE).with_default("aGVsbG8="));
    params.register_parameter("tags", string_array("tags", parameter_location::QUERY, collection_format::CSV)
            .with_default("a,b"));
    params.register_parameter("best_friend", parameter_descriptor("friend", parameter_location::BODY, parameter_type::OBJECT)
            .with_default(generic_object{{"name", "Jane"}, {"age", 31}}));

    request_binder<default_params> binder(std::move(params), field_map<default_params>()
            .add("flag", &default_params::flag)
            .add("count", &default_params::count)
            .add("ratio", &default_params::ratio)
            .add("name", &default_params::name)
            .add("birthday", &default_params::birthday)
            .add("last_seen", &default_params::last_seen)
            .add("picture", &default_params::picture)
            .add("tags", &default_params::tags)
            .add("best_friend", &default_params::best_friend, friend_fields()));

    auto req = http::request::make("GET", "localhost", "/pets");
    default_params dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_REQUIRE_MESSAGE(result.is_valid(), fmt::format("{}", result));

    BOOST_CHECK_EQUAL(dest.flag, true);
    BOOST_CHECK_EQUAL(dest.count, 3);
    BOOST_CHECK_EQUAL(dest.ratio, 0.5f);
    BOOST_CHECK_EQUAL(dest.name, "Rex");
    BOOST_CHECK(dest.birthday == *parse_date("2014-08-09"));
    BOOST_CHECK(dest.last_seen == *parse_date_time("2014-10-12T08:05:05Z"));
    BOOST_CHECK_EQUAL(std::string(dest.picture.begin(), dest.picture.end()), "hello");
    BOOST_CHECK((dest.tags == std::vector<sstring>{"a", "b"}));
    BOOST_CHECK_EQUAL(dest.best_friend.name, "Jane");
    BOOST_CHECK_EQUAL(dest.best_friend.age, 31);
}

struct ratio_params {
    float ratio = 0;
};

BOOST_AUTO_TEST_CASE(test_double_into_float_member) {
    parameter_registry params;
    params.register_parameter("ratio", parameter_descriptor("ratio", parameter_location::QUERY, parameter_type::NUMBER)
            .with_format(parameter_format::DOUBLE));
    request_binder<ratio_params> binder(std::move(params), field_map<ratio_params>().add("ratio", &ratio_params::ratio));

    auto req = http::request::make("GET", "localhost", "/pets?ratio=2.5");
    ratio_params dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_REQUIRE_MESSAGE(result.is_valid(), fmt::format("{}", result));
    BOOST_CHECK_EQUAL(dest.ratio, 2.5f);

    auto huge = http::request::make("GET", "localhost", "/pets?ratio=1e300");
    result = binder.bind(huge, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK_EQUAL(result.errors()[0].name, "ratio");
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::MALFORMED_VALUE);
    BOOST_CHECK_EQUAL(dest.ratio, 2.5f);

    auto infinite = http::request::make("GET", "localhost", "/pets?ratio=inf");
    result = binder.bind(infinite, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::MALFORMED_VALUE);
}

BOOST_AUTO_TEST_CASE(test_invalid_default_is_configuration_error) {
    parameter_registry params;
    params.register_parameter("id", parameter_descriptor("id", parameter_location::QUERY, parameter_type::INTEGER)
            .with_default("many"));
    request_binder<pet_id_params> binder(std::move(params), field_map<pet_id_params>().add("id", &pet_id_params::id));

    auto req = http::request::make("GET", "localhost", "/pets");
    pet_id_params dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::CONFIGURATION_ERROR);
}

struct order_body {
    int64_t id = 0;
    std::optional<pet_friend> owner;
    std::unique_ptr<pet_friend> courier;
    std::vector<pet_friend> friends;
};

struct order_params {
    int64_t version = 0;
    order_body body;
};

request_binder<order_params> make_order_binder() {
    auto order_fields = field_map<order_body>()
            .add("id", &order_body::id)
            .add("owner", &order_body::owner, friend_fields())
            .add("courier", &order_body::courier, friend_fields())
            .add("friends", &order_body::friends, friend_fields());

    parameter_registry params;
    params.register_parameter("version", parameter_descriptor("version", parameter_location::QUERY, parameter_type::INTEGER));
    params.register_parameter("body", parameter_descriptor("body", parameter_location::BODY, parameter_type::OBJECT, true));
    return request_binder<order_params>(std::move(params), field_map<order_params>()
            .add("version", &order_params::version)
            .add("body", &order_params::body, std::move(order_fields)));
}

BOOST_AUTO_TEST_CASE(test_nested_body) {
    auto binder = make_order_binder();
    auto req = http::request::make("POST", "localhost", "/orders?version=2");
    req.write_body("application/json", sstring(R"({
        "id": 7,
        "owner": {"name": "Ann", "age": 30},
        "courier": {"name": "Bob", "age": 41},
        "friends": [{"name": "Cid", "age": 1}, {"name": "Dee", "age": 2}]
    })"));

    order_params dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_REQUIRE_MESSAGE(result.is_valid(), fmt::format("{}", result));
    BOOST_CHECK_EQUAL(dest.version, 2);
    BOOST_CHECK_EQUAL(dest.body.id, 7);
    BOOST_REQUIRE(dest.body.owner);
    BOOST_CHECK_EQUAL(dest.body.owner->name, "Ann");
    BOOST_REQUIRE(dest.body.courier);
    BOOST_CHECK_EQUAL(dest.body.courier->age, 41);
    BOOST_REQUIRE_EQUAL(dest.body.friends.size(), 2u);
    BOOST_CHECK_EQUAL(dest.body.friends[1].name, "Dee");
}

BOOST_AUTO_TEST_CASE(test_nested_body_errors_are_named_by_path) {
    auto binder = make_order_binder();
    auto req = http::request::make("POST", "localhost", "/orders");
    req.write_body("application/json", sstring(R"({
        "id": 7,
        "friends": [{"name": "Cid", "age": 1}, {"name": "Dee", "age": "two"}]
    })"));

    order_params dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK_EQUAL(result.errors()[0].name, "body.friends[1].age");
    BOOST_CHECK_EQUAL(result.errors()[0].in, "body");
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::MALFORMED_VALUE);
    BOOST_CHECK(!dest.body.owner);
    BOOST_CHECK(!dest.body.courier);
    BOOST_CHECK(dest.body.friends.empty());
}

BOOST_AUTO_TEST_CASE(test_missing_required_body) {
    auto binder = make_order_binder();
    auto req = http::request::make("POST", "localhost", "/orders");
    order_params dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::MISSING_REQUIRED);
}

BOOST_AUTO_TEST_CASE(test_invalid_payload_does_not_stop_other_parameters) {
    auto binder = make_order_binder();
    auto req = http::request::make("POST", "localhost", "/orders?version=3");
    req.write_body("application/json", sstring("{]"));

    order_params dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK_EQUAL(result.errors()[0].name, "body");
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::DECODE_FAILURE);
    BOOST_CHECK_EQUAL(dest.version, 3);
}

BOOST_AUTO_TEST_CASE(test_body_media_types) {
    auto binder = make_order_binder();
    order_params dest;

    auto malformed = http::request::make("POST", "localhost", "/orders");
    malformed.write_body("application(", sstring(R"({"id": 1})"));
    auto result = binder.bind(malformed, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::UNSUPPORTED_MEDIA_TYPE);

    auto xml = http::request::make("POST", "localhost", "/orders");
    xml.write_body("application/xml", sstring("<order/>"));
    result = binder.bind(xml, {}, json, dest);
    BOOST_CHECK(has_error(result, "body", binding_error_kind::UNSUPPORTED_MEDIA_TYPE));

    auto problem = http::request::make("POST", "localhost", "/orders");
    problem.write_body("application/vnd.order+json; charset=utf-8", sstring(R"({"id": 9})"));
    result = binder.bind(problem, {}, json, dest);
    BOOST_CHECK(result.is_valid());
    BOOST_CHECK_EQUAL(dest.body.id, 9);
}

BOOST_AUTO_TEST_CASE(test_consumed_body) {
    auto binder = make_order_binder();
    auto req = http::request::make("POST", "localhost", "/orders");
    req.write_body("application/json", sstring(R"({"id": 1})"));
    req.content_stream.read_all();

    order_params dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::DECODE_FAILURE);
}

namespace {

// Hands out one chunk, then loses the peer
class disconnecting_source final : public http::content_source_impl {
    bool _first = true;
public:
    virtual sstring get() override {
        if (std::exchange(_first, false)) {
            return "{\"id\": ";
        }
        throw std::system_error(ECONNRESET, std::system_category());
    }
};

}

BOOST_AUTO_TEST_CASE(test_client_disconnect_mid_body) {
    auto binder = make_order_binder();
    auto req = http::request::make("POST", "localhost", "/orders?version=4");
    req.write_body("application/json", 100, http::content_source(std::make_unique<disconnecting_source>()));

    order_params dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK_EQUAL(result.errors()[0].name, "body");
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::DECODE_FAILURE);
    BOOST_CHECK_EQUAL(dest.version, 4);
}

BOOST_AUTO_TEST_CASE(test_multi_outside_query) {
    parameter_registry params;
    params.register_parameter("tags", string_array("X-Tags", parameter_location::HEADER, collection_format::MULTI));
    request_binder<tag_params> binder(std::move(params), field_map<tag_params>().add("tags", &tag_params::tags));

    auto req = http::request::make("GET", "localhost", "/");
    req._headers["X-Tags"] = "a";
    tag_params dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::MALFORMED_COLLECTION);

    parameter_registry path_params;
    path_params.register_parameter("tags", string_array("tags", parameter_location::PATH, collection_format::MULTI));
    request_binder<tag_params> path_binder(std::move(path_params), field_map<tag_params>().add("tags", &tag_params::tags));
    result = path_binder.bind(req, {{"tags", "a"}}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::MALFORMED_COLLECTION);
}

BOOST_AUTO_TEST_CASE(test_malformed_collection_item) {
    struct id_list {
        std::vector<int64_t> ids;
    };
    parameter_registry params;
    params.register_parameter("ids", parameter_descriptor("ids", parameter_location::QUERY, parameter_type::ARRAY)
            .with_collection_format(collection_format::PIPES)
            .with_items(parameter_descriptor("ids", parameter_location::QUERY, parameter_type::INTEGER)));
    request_binder<id_list> binder(std::move(params), field_map<id_list>().add("ids", &id_list::ids));

    auto req = http::request::make("GET", "localhost", "/?ids=1|x|3");
    id_list dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::MALFORMED_COLLECTION);
    BOOST_CHECK(result.errors()[0].message.find("item 1") != sstring::npos);
    BOOST_CHECK(dest.ids.empty());
}

BOOST_AUTO_TEST_CASE(test_configuration_errors) {
    parameter_registry params;
    params.register_parameter("id", parameter_descriptor("id", "cookie", parameter_type::INTEGER));
    params.register_parameter("missing", parameter_descriptor("missing", parameter_location::QUERY, parameter_type::STRING));
    request_binder<pet_id_params> binder(std::move(params), field_map<pet_id_params>().add("id", &pet_id_params::id));

    auto req = http::request::make("GET", "localhost", "/?id=1&missing=x");
    pet_id_params dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 2u);
    BOOST_CHECK_EQUAL(result.errors()[0].in, "cookie");
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::CONFIGURATION_ERROR);
    BOOST_CHECK_EQUAL(result.errors()[1].name, "missing");
    BOOST_CHECK(result.errors()[1].kind == binding_error_kind::CONFIGURATION_ERROR);
    BOOST_CHECK_EQUAL(dest.id, 0);
}

BOOST_AUTO_TEST_CASE(test_second_body_parameter) {
    struct two_bodies {
        generic_value first;
        generic_value second;
    };
    parameter_registry params;
    params.register_parameter("first", parameter_descriptor("first", parameter_location::BODY, parameter_type::OBJECT));
    params.register_parameter("second", parameter_descriptor("second", parameter_location::BODY, parameter_type::OBJECT));
    request_binder<two_bodies> binder(std::move(params), field_map<two_bodies>()
            .add("first", &two_bodies::first)
            .add("second", &two_bodies::second));

    auto req = http::request::make("POST", "localhost", "/");
    req.write_body("application/json", sstring(R"({"a": 1})"));
    two_bodies dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK_EQUAL(result.errors()[0].name, "second");
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::CONFIGURATION_ERROR);
    BOOST_CHECK(dest.first.find("a"));
}

BOOST_AUTO_TEST_CASE(test_duplicate_field_mapping) {
    BOOST_CHECK_THROW(field_map<pet_id_params>().add("id", &pet_id_params::id).add("id", &pet_id_params::id),
            binding_configuration_exception);

    parameter_registry params;
    params.register_parameter("id", parameter_descriptor("id", parameter_location::QUERY, parameter_type::INTEGER));
    BOOST_CHECK_THROW(params.register_parameter("id", parameter_descriptor("id", parameter_location::PATH, parameter_type::INTEGER)),
            binding_configuration_exception);
}

struct form_params {
    sstring name;
    std::vector<sstring> tags;
};

request_binder<form_params> make_form_binder() {
    parameter_registry params;
    params.register_parameter("name", parameter_descriptor("name", parameter_location::FORM, parameter_type::STRING, true));
    params.register_parameter("tags", string_array("tags", parameter_location::FORM, collection_format::CSV));
    return request_binder<form_params>(std::move(params), field_map<form_params>()
            .add("name", &form_params::name)
            .add("tags", &form_params::tags));
}

BOOST_AUTO_TEST_CASE(test_urlencoded_form) {
    auto binder = make_form_binder();
    auto req = http::request::make("POST", "localhost", "/pets");
    req.write_body("application/x-www-form-urlencoded", sstring("name=Rex+Jr&tags=a,b"));

    form_params dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_REQUIRE_MESSAGE(result.is_valid(), fmt::format("{}", result));
    BOOST_CHECK_EQUAL(dest.name, "Rex Jr");
    BOOST_CHECK((dest.tags == std::vector<sstring>{"a", "b"}));
}

BOOST_AUTO_TEST_CASE(test_malformed_form) {
    auto binder = make_form_binder();
    auto req = http::request::make("POST", "localhost", "/pets");
    req.write_body("application/x-www-form-urlencoded", sstring("name=%3"));

    form_params dest;
    auto result = binder.bind(req, {}, json, dest);
    // every form parameter reports the broken body
    BOOST_REQUIRE_EQUAL(result.errors().size(), 2u);
    BOOST_CHECK(has_error(result, "name", binding_error_kind::DECODE_FAILURE));
    BOOST_CHECK(has_error(result, "tags", binding_error_kind::DECODE_FAILURE));
}

BOOST_AUTO_TEST_CASE(test_form_needs_form_body) {
    auto binder = make_form_binder();
    auto req = http::request::make("POST", "localhost", "/pets");
    req.write_body("application/json", sstring(R"({"name": "Rex"})"));

    form_params dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_CHECK(has_error(result, "name", binding_error_kind::UNSUPPORTED_MEDIA_TYPE));
}

struct upload_params {
    sstring name;
    file_upload file;
};

request_binder<upload_params> make_upload_binder(sstring file_name = "file", bool file_required = true) {
    parameter_registry params;
    params.register_parameter("name", parameter_descriptor("name", parameter_location::FORM, parameter_type::STRING, true));
    params.register_parameter("file", parameter_descriptor(file_name, parameter_location::FORM, parameter_type::FILE, file_required));
    return request_binder<upload_params>(std::move(params), field_map<upload_params>()
            .add("name", &upload_params::name)
            .add("file", &upload_params::file));
}

BOOST_AUTO_TEST_CASE(test_multipart_upload) {
    auto binder = make_upload_binder();
    auto req = http::request::make("POST", "localhost", "/pets/1/upload");
    req.write_body("multipart/form-data; boundary=boundary", upload_body);

    upload_params dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_REQUIRE_MESSAGE(result.is_valid(), fmt::format("{}", result));
    BOOST_CHECK_EQUAL(dest.name, "Rex");
    BOOST_CHECK_EQUAL(dest.file.filename, "rex.txt");
    BOOST_CHECK_EQUAL(dest.file.content_type, "text/plain");
    BOOST_CHECK_EQUAL(dest.file.size, 14u);
    BOOST_CHECK_EQUAL(dest.file.data.read_all(), "uploaded bytes");

    // the file content can be read once
    BOOST_CHECK_THROW(dest.file.data.read_all(), http::stream_consumed_exception);
}

BOOST_AUTO_TEST_CASE(test_multipart_reader_consumed) {
    auto binder = make_upload_binder();
    auto req = http::request::make("POST", "localhost", "/pets/1/upload");
    req.write_body("multipart/form-data; boundary=boundary", upload_body);

    upload_params first;
    BOOST_REQUIRE(binder.bind(req, {}, json, first).is_valid());

    upload_params second;
    auto result = binder.bind(req, {}, json, second);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 2u);
    BOOST_CHECK(has_error(result, "name", binding_error_kind::DECODE_FAILURE));
    BOOST_CHECK(has_error(result, "file", binding_error_kind::DECODE_FAILURE));
}

BOOST_AUTO_TEST_CASE(test_file_needs_multipart) {
    auto binder = make_upload_binder();
    auto req = http::request::make("POST", "localhost", "/pets/1/upload");
    req.write_body("application/x-www-form-urlencoded", sstring("name=Rex"));

    upload_params dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK_EQUAL(result.errors()[0].name, "file");
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::UNSUPPORTED_MEDIA_TYPE);
    BOOST_CHECK_EQUAL(dest.name, "Rex");

    auto malformed = http::request::make("POST", "localhost", "/pets/1/upload");
    malformed.write_body("multipart(", upload_body);
    result = binder.bind(malformed, {}, json, dest);
    BOOST_CHECK(has_error(result, "file", binding_error_kind::UNSUPPORTED_MEDIA_TYPE));
}

BOOST_AUTO_TEST_CASE(test_missing_file_part) {
    auto binder = make_upload_binder("picture");
    auto req = http::request::make("POST", "localhost", "/pets/1/upload");
    req.write_body("multipart/form-data; boundary=boundary", upload_body);

    upload_params dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK_EQUAL(result.errors()[0].name, "picture");
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::MISSING_REQUIRED);

    // a plain field where a file part is expected
    auto field_binder = make_upload_binder("name");
    auto again = http::request::make("POST", "localhost", "/pets/1/upload");
    again.write_body("multipart/form-data; boundary=boundary", upload_body);
    result = field_binder.bind(again, {}, json, dest);
    BOOST_CHECK(has_error(result, "name", binding_error_kind::MALFORMED_VALUE));
}

BOOST_AUTO_TEST_CASE(test_missing_optional_file_part) {
    auto binder = make_upload_binder("picture", false);
    auto req = http::request::make("POST", "localhost", "/pets/1/upload");
    req.write_body("multipart/form-data; boundary=boundary", upload_body);

    upload_params dest;
    auto result = binder.bind(req, {}, json, dest);
    BOOST_CHECK(!result.is_valid());
    BOOST_REQUIRE_EQUAL(result.errors().size(), 1u);
    BOOST_CHECK_EQUAL(result.errors()[0].name, "picture");
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::MISSING_REQUIRED);
    BOOST_CHECK_EQUAL(dest.name, "Rex");
}

struct search_params {
    int64_t id = 0;
    int32_t limit = 0;
    sstring request_id;
    std::vector<int32_t> sizes;
    bool verbose = false;
};

BOOST_AUTO_TEST_CASE(test_every_failure_is_reported_in_declaration_order) {
    parameter_registry params;
    params.register_parameter("id", parameter_descriptor("id", parameter_location::PATH, parameter_type::INTEGER, true));
    params.register_parameter("limit", parameter_descriptor("limit", parameter_location::QUERY, parameter_type::INTEGER)
            .with_format(parameter_format::INT32));
    params.register_parameter("request_id", parameter_descriptor("X-Request-Id", parameter_location::HEADER, parameter_type::STRING, true));
    params.register_parameter("sizes", parameter_descriptor("sizes", parameter_location::QUERY, parameter_type::ARRAY)
            .with_items(parameter_descriptor("sizes", parameter_location::QUERY, parameter_type::INTEGER)
                    .with_format(parameter_format::INT32)));
    params.register_parameter("verbose", parameter_descriptor("verbose", parameter_location::QUERY, parameter_type::BOOLEAN));
    request_binder<search_params> binder(std::move(params), field_map<search_params>()
            .add("id", &search_params::id)
            .add("limit", &search_params::limit)
            .add("request_id", &search_params::request_id)
            .add("sizes", &search_params::sizes)
            .add("verbose", &search_params::verbose));

    auto req = http::request::make("GET", "localhost", "/search/5?limit=ten&sizes=1,x&verbose=true");
    search_params dest;
    auto result = binder.bind(req, {{"id", "5"}}, json, dest);

    BOOST_REQUIRE_EQUAL(result.errors().size(), 3u);
    BOOST_CHECK_EQUAL(result.errors()[0].name, "limit");
    BOOST_CHECK(result.errors()[0].kind == binding_error_kind::MALFORMED_VALUE);
    BOOST_CHECK_EQUAL(result.errors()[1].name, "X-Request-Id");
    BOOST_CHECK(result.errors()[1].kind == binding_error_kind::MISSING_REQUIRED);
    BOOST_CHECK_EQUAL(result.errors()[2].name, "sizes");
    BOOST_CHECK(result.errors()[2].kind == binding_error_kind::MALFORMED_COLLECTION);

    BOOST_CHECK_EQUAL(dest.id, 5);
    BOOST_CHECK_EQUAL(dest.verbose, true);
}
