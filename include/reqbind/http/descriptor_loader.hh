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
#include <iosfwd>

namespace reqbind::httpd {

/**
 * Load parameter descriptors from a YAML document.
 *
 * The document is a sequence of swagger-like parameter objects:
 * \code {.yaml}
 * - field: id
 *   name: id
 *   in: path
 *   type: integer
 *   format: int64
 *   required: true
 * - name: tags
 *   in: query
 *   type: array
 *   collectionFormat: pipes
 *   items: { type: string }
 * \endcode
 *
 * `field` defaults to `name`. Array items and object properties take the
 * location of their parent. Properties are a sequence of parameter objects
 * as well.
 *
 * @throws descriptor_config_exception on invalid YAML, missing or unknown
 *  keys, or unknown types, formats and collection formats. An unknown `in`
 *  is kept and reported when binding.
 */
parameter_registry load_parameter_registry(std::istream& input);

/// Same as above, reading the document from file \c path
parameter_registry load_parameter_registry_file(const sstring& path);

}
