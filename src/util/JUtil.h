// Copyright (c) 2013-2024 LG Electronics, Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//
// SPDX-License-Identifier: Apache-2.0

#ifndef UTIL_JUTIL_H_
#define UTIL_JUTIL_H_

#include <string>
#include <stdint.h>
#include <pbnjson.hpp>

//! JSON helpers over pbnjson
class JUtil {
public:
    //! Parse raw json text. Returns a null JValue on failure, with the
    //! parser's reason in r_reason when given.
    static pbnjson::JValue parse(const char* rawData, std::string* r_reason = NULL);

    //! Serialize without schema validation
    static std::string toSimpleString(pbnjson::JValue json);

    //! Read a string member, or fallback when absent or not a string
    static std::string getString(const pbnjson::JValue& obj, const char* key, const std::string& fallback = "");

    //! Read an integer member, or fallback when absent or not a number
    static int64_t getInt64(const pbnjson::JValue& obj, const char* key, int64_t fallback = 0);

    //! Read a boolean member, or fallback when absent or not a boolean
    static bool getBool(const pbnjson::JValue& obj, const char* key, bool fallback = false);
};

#endif /* UTIL_JUTIL_H_ */
