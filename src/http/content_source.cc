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

#include <reqbind/http/content_source.hh>
#include <reqbind/http/exception.hh>

namespace reqbind {

namespace http {

sstring content_source::read_all(std::string_view what) {
    if (_consumed) {
        throw stream_consumed_exception(sstring(what));
    }
    // a failed read leaves the stream unusable as well
    _consumed = true;
    sstring ret;
    if (!_impl) {
        return ret;
    }
    while (true) {
        auto chunk = _impl->get();
        if (chunk.empty()) {
            break;
        }
        ret += chunk;
    }
    _impl.reset();
    return ret;
}

sstring memory_content_source::get() {
    if (_pos >= _data.size()) {
        return {};
    }
    auto chunk = _data.substr(_pos, _chunk_size);
    _pos += chunk.size();
    return chunk;
}

}

}
