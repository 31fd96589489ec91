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

namespace reqbind {

namespace http {
namespace internal {

/**
 * Decode a query or form component. `+` decodes to a space.
 * Returns false on a truncated escape or a non-hex digit.
 */
bool url_decode(const std::string_view& in, sstring& out);

/**
 * Decode a path segment. Unlike url_decode, `+` is kept as is.
 */
bool path_decode(const std::string_view& in, sstring& out);

} // internal namespace
} // http namespace

} // reqbind namespace
