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
#include <reqbind/http/parameter_metadata.hh>
#include <string_view>
#include <vector>

namespace reqbind::httpd {

/// The item separator of a delimited collection format, '\0' for MULTI
char collection_separator(collection_format format) noexcept;

/**
 * Split one delimited text value into its items.
 *
 * Items are trimmed of surrounding blanks (except for SSV, where blanks
 * are the separator) and empty items are dropped. With MULTI the text is a
 * single item, or none when it is empty.
 */
std::vector<sstring> split_collection(std::string_view text, collection_format format);

/**
 * Turn the raw values of one parameter into its items.
 *
 * With MULTI every non-empty value is an item, passed through as is. With any other
 * format the first value is split as above.
 */
std::vector<sstring> split_collection(const std::vector<sstring>& values, collection_format format);

}
