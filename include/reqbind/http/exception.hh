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

#include <exception>
#include <string>

namespace reqbind {

namespace http {

/**
 * The base_exception is a base for all request layer exceptions.
 * It holds a message that describes what went wrong while reading
 * or interpreting the request.
 */
class base_exception : public std::exception {
public:
    explicit base_exception(const std::string& msg)
            : _msg(msg) {
    }

    virtual const char* what() const noexcept {
        return _msg.c_str();
    }

    virtual const std::string& str() const {
        return _msg;
    }
private:
    std::string _msg;
};

/**
 * Thrown when the request cannot be interpreted as sent by the client.
 */
class bad_request_exception : public base_exception {
public:
    explicit bad_request_exception(const std::string& msg)
            : base_exception(msg) {
    }
};

/**
 * The request media type is missing, malformed or not the one
 * the operation needs.
 */
class unsupported_media_type_exception : public bad_request_exception {
public:
    explicit unsupported_media_type_exception(const std::string& msg)
            : bad_request_exception(msg) {
    }
};

/**
 * A form or multipart body does not follow its encoding rules.
 */
class malformed_body_exception : public bad_request_exception {
public:
    explicit malformed_body_exception(const std::string& msg)
            : bad_request_exception(
                    std::string("Malformed request body: ") + msg) {
    }
};

/**
 * A read-once content source was read a second time.
 */
class stream_consumed_exception : public base_exception {
public:
    explicit stream_consumed_exception(const std::string& what)
            : base_exception(what + " was already consumed") {
    }
};

}

}

