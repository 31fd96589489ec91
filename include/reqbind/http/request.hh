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

//
// request.hpp
// ~~~~~~~~~~~
//
// Copyright (c) 2003-2013 Christopher M. Kohlhoff (chris at kohlhoff dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <reqbind/core/sstring.hh>
#include <reqbind/http/content_source.hh>
#include <reqbind/http/mime_types.hh>
#include <reqbind/util/string_utils.hh>

#include <optional>
#include <unordered_map>
#include <vector>

namespace reqbind {

namespace http {

/**
 * A request received from a client.
 */
struct request {
    sstring _method;
    sstring _url;
    sstring _version;
    size_t content_length = 0;
    std::unordered_map<sstring, sstring, reqbind::internal::case_insensitive_hash, reqbind::internal::case_insensitive_cmp> _headers;
    /*
     * Every value of every query parameter, in the order they appear in the url.
     * A parameter given without a value ("?a" or "?a=") holds a single empty string.
     */
    std::unordered_map<sstring, std::vector<sstring>> _query_params;
    /*
     * The request content. It can be read once; whoever reads it owns the bytes.
     */
    content_source content_stream;

    /**
     * Search for the first header of a given name
     * @param name the header name
     * @return the header value, if it exists or empty string
     */
    sstring get_header(const sstring& name) const {
        auto res = _headers.find(name);
        if (res == _headers.end()) {
            return "";
        }
        return res->second;
    }

    bool has_header(const sstring& name) const {
        return _headers.find(name) != _headers.end();
    }

    /**
     * Search for all values of a given query parameter
     * @param key the query paramerter key
     * @return a pointer to the values in url order, or nullptr if the key
     *  does not appear in the url
     */
    const std::vector<sstring>* get_query_param_array(const sstring& key) const {
        auto res = _query_params.find(key);
        if (res == _query_params.end()) {
            return nullptr;
        }
        return &res->second;
    }

    /**
     * The parsed Content-Type header
     * @return std::nullopt when the header is missing or malformed
     */
    std::optional<media_type> get_media_type() const {
        auto it = _headers.find("Content-Type");
        if (it == _headers.end()) {
            return std::nullopt;
        }
        return mime_types::parse_media_type(it->second);
    }

    /**
     * Set the query parameters in the request objects.
     * Returns the URL path part, i.e. -- without the query paremters
     * query param appear after the question mark and are separated
     * by the ampersand sign.
     * A parameter that cannot be url decoded is skipped.
     */
    sstring parse_query_param();

    /**
     * Set the Content-Type header
     */
    void set_mime_type(const sstring& mime);

    /**
     * \brief Write a string as the body
     *
     * \param mime - the Content-Type header value, e.g. "application/json"
     * \param content - the message content.
     * This would set the the content stream, conent length and content type
     * of the message.
     */
    void write_body(const sstring& mime, sstring content);

    /**
     * \brief Attach a stream as the body
     *
     * \param mime - the Content-Type header value
     * \param len - known in advance content length
     * \param body - the content stream
     */
    void write_body(const sstring& mime, size_t len, content_source body);

    /**
     * \brief Make simple request
     *
     * \param method - method to use, e.g. "GET" or "POST"
     * \param host - host to contact. This value will be used as the "Host" header
     * \path - the URL of the request, query string included
     *
     */
    static request make(sstring method, sstring host, sstring path);

private:
    void add_query_param(std::string_view param);
};

} // namespace http

}
