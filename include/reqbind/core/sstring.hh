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

#include <string>
#include <string_view>
#include <fmt/format.h>

namespace reqbind {

// The new std::string ABI (no reference counting, small buffer optimization)
// makes a dedicated string class unnecessary here.
using sstring = std::string;

template <typename T>
inline sstring to_sstring(T value) {
    return fmt::to_string(value);
}

}
