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

#include <memory>
#include <string_view>
#include <vector>

namespace reqbind {

namespace http {

/// Producer side of a content stream.
///
/// Implementations hand out the content chunk by chunk. An empty chunk
/// signals the end of the stream. A transport that loses its peer
/// mid-stream reports it by throwing (typically std::system_error).
class content_source_impl {
public:
    virtual ~content_source_impl() = default;
    virtual sstring get() = 0;
};

/// A read-once stream of request content (a body or a multipart file part).
///
/// The stream can be drained exactly once; draining it again throws
/// stream_consumed_exception. A default constructed source is an empty
/// stream.
class content_source {
    std::unique_ptr<content_source_impl> _impl;
    bool _consumed = false;
public:
    content_source() noexcept = default;
    explicit content_source(std::unique_ptr<content_source_impl> impl) noexcept
        : _impl(std::move(impl)) {}
    content_source(content_source&&) noexcept = default;
    content_source& operator=(content_source&&) noexcept = default;

    bool consumed() const noexcept {
        return _consumed;
    }

    /// Read everything that is left in the stream.
    ///
    /// \param what names the stream in the exception thrown on a second read
    sstring read_all(std::string_view what = "content stream");
};

/// Serves an in-memory buffer, optionally split into fixed size chunks
class memory_content_source final : public content_source_impl {
    sstring _data;
    size_t _chunk_size;
    size_t _pos = 0;
public:
    explicit memory_content_source(sstring data, size_t chunk_size = 0) noexcept
        : _data(std::move(data))
        , _chunk_size(chunk_size == 0 ? _data.size() : chunk_size) {}

    virtual sstring get() override;
};

inline content_source as_content_source(sstring data, size_t chunk_size = 0) {
    return content_source(std::make_unique<memory_content_source>(std::move(data), chunk_size));
}

}

}
