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

#include <string_view>
#include <utility>

#include <reqbind/http/request.hh>
#include <reqbind/http/url.hh>

namespace reqbind {
namespace http {

void request::add_query_param(std::string_view param) {
    if (param.empty()) {
        return;
    }
    size_t split = param.find('=');
    if (split >= param.length() - 1) {
        sstring key;
        if (http::internal::url_decode(param.substr(0,split) , key)) {
            _query_params[key].push_back("");
        }
    } else {
        sstring key;
        sstring value;
        if (http::internal::url_decode(param.substr(0,split), key)
                && http::internal::url_decode(param.substr(split + 1), value)) {
            _query_params[key].push_back(std::move(value));
        }
    }
}

sstring request::parse_query_param() {
    _query_params.clear();
    size_t pos = _url.find('?');
    if (pos == sstring::npos) {
        return _url;
    }
    size_t curr = pos + 1;
    size_t end_param;
    std::string_view url = _url;
    while ((end_param = _url.find('&', curr)) != sstring::npos) {
        add_query_param(url.substr(curr, end_param - curr) );
        curr = end_param + 1;
    }
    add_query_param(url.substr(curr));
    return _url.substr(0, pos);
}

void request::set_mime_type(const sstring& mime) {
    _headers["Content-Type"] = mime;
}

void request::write_body(const sstring& mime, sstring content) {
    auto len = content.size();
    write_body(mime, len, as_content_source(std::move(content)));
}

void request::write_body(const sstring& mime, size_t len, content_source body) {
    set_mime_type(mime);
    content_length = len;
    _headers["Content-Length"] = to_sstring(content_length);
    content_stream = std::move(body);
}

request request::make(sstring method, sstring host, sstring path) {
    request rq;
    rq._version = "1.1";
    rq._method = std::move(method);
    rq._url = std::move(path);
    rq._headers["Host"] = std::move(host);
    rq.parse_query_param();
    return rq;
}

} // http namespace
} // reqbind namespace
