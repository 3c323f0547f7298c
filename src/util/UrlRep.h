// Copyright (c) 2012-2024 LG Electronics, Inc.
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

#ifndef UTIL_URLREP_H_
#define UTIL_URLREP_H_

#include <string>

// The parts of a url that name the remote file. Only the scheme is
// required; the file name drives the extension of the local copy.
struct UrlRep {
    static const size_t MAX_EXTENSION_LENGTH = 8;

    static UrlRep fromUrl(const char* uri);
    static UrlRep fromUrl(const std::string& uri);

    UrlRep()
        : m_valid(false)
    {
    }

    // "mp3" for ".../x.mp3". Empty when the file name has no extension or
    // the extension is too long or not alphanumeric.
    std::string resourceExtension() const;

    bool m_valid;
    std::string m_scheme;
    std::string m_path;           // escaped, always starts with '/'
    std::string m_fileName;       // unescaped last segment of m_path
};

#endif /* UTIL_URLREP_H_ */
