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

#include <reqbind/http/content_source.hh>
#include <reqbind/http/generic_value.hh>
#include <reqbind/http/mime_types.hh>

namespace reqbind::httpd {

/**
 * Decodes request bodies of the media types it supports into generic values.
 *
 * Implementations must be usable from several threads at once.
 */
class consumer {
public:
    virtual ~consumer() = default;

    /// Whether bodies of media type \c mt can be decoded
    virtual bool supports(const http::media_type& mt) const = 0;

    /**
     * Read \c body to its end and decode it.
     *
     * @throws decode_exception if the payload is malformed
     * @throws whatever reading \c body throws
     */
    virtual generic_value consume(http::content_source& body) const = 0;
};

/// Decodes `application/json` and `+json` bodies with jsoncpp
class json_consumer final : public consumer {
public:
    bool supports(const http::media_type& mt) const override;
    generic_value consume(http::content_source& body) const override;
};

}
