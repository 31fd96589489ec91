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

#define BOOST_TEST_MODULE generic_value

#include <boost/test/unit_test.hpp>
#include <reqbind/http/generic_value.hh>

#include <fmt/format.h>

using namespace reqbind;
using namespace reqbind::httpd;

BOOST_AUTO_TEST_CASE(test_kinds) {
    BOOST_CHECK(generic_value().is_null());
    BOOST_CHECK(generic_value(true).type() == generic_value::kind::boolean);
    BOOST_CHECK(generic_value(1).type() == generic_value::kind::integer);
    BOOST_CHECK(generic_value(1.5).type() == generic_value::kind::real);
    BOOST_CHECK(generic_value("x").type() == generic_value::kind::string);
    BOOST_CHECK(generic_value(generic_array{}).type() == generic_value::kind::array);
    BOOST_CHECK(generic_value(generic_object{}).type() == generic_value::kind::object);

    BOOST_CHECK_EQUAL(to_string(generic_value::kind::real), "number");
    BOOST_CHECK_EQUAL(to_string(generic_value::kind::object), "object");
}

BOOST_AUTO_TEST_CASE(test_access) {
    generic_value v(generic_object{
        {"name", generic_value("Jane")},
        {"age", generic_value(31)},
    });
    auto name = v.find("name");
    BOOST_REQUIRE(name);
    BOOST_CHECK_EQUAL(*name->get_if<sstring>(), "Jane");
    BOOST_CHECK_EQUAL(*v.find("age")->get_if<int64_t>(), 31);
    BOOST_CHECK(!v.find("missing"));
    BOOST_CHECK(!v.find("age")->get_if<double>());

    // not an object
    BOOST_CHECK(!generic_value(1).find("name"));
}

BOOST_AUTO_TEST_CASE(test_equality) {
    BOOST_CHECK(generic_value(1) == generic_value(int64_t(1)));
    BOOST_CHECK(!(generic_value(1) == generic_value(1.0)));
    BOOST_CHECK(generic_value(generic_array{generic_value("a")}) == generic_value(generic_array{generic_value("a")}));
    BOOST_CHECK(!(generic_value() == generic_value(false)));
}

BOOST_AUTO_TEST_CASE(test_rendering) {
    generic_value v(generic_object{
        {"name", generic_value("say \"hi\"")},
        {"tags", generic_value(generic_array{generic_value(1), generic_value(true), generic_value()})},
    });
    BOOST_CHECK_EQUAL(v.to_string(), R"({"name":"say \"hi\"","tags":[1,true,null]})");
    BOOST_CHECK_EQUAL(fmt::format("{}", generic_value(2.5)), "2.5");
}
