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

#include <reqbind/http/url.hh>

namespace reqbind {
namespace http {
namespace internal {

namespace {

int hex_to_byte(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    } else if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}


bool decode(const std::string_view& in, sstring& out, bool plus_as_space) {
    sstring buff;
    buff.reserve(in.length());
    for (size_t i = 0; i < in.length(); ++i) {
        if (in[i] == '%') {
            if (i + 2 >= in.size()) {
                return false;
            }
            int hi = hex_to_byte(in[i + 1]);
            int lo = hex_to_byte(in[i + 2]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            buff.push_back(static_cast<char>(hi * 16 + lo));
            i += 2;
        } else if (plus_as_space && in[i] == '+') {
            buff.push_back(' ');
        } else {
            buff.push_back(in[i]);
        }
    }
    out = std::move(buff);
    return true;
}

}

bool url_decode(const std::string_view& in, sstring& out) {
    return decode(in, out, true);
}

bool path_decode(const std::string_view& in, sstring& out) {
    return decode(in, out, false);
}

} // internal namespace
} // http namespace
} // reqbind namespace
