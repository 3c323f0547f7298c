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

#ifndef BASE_FILESTORE_H_
#define BASE_FILESTORE_H_

#include <string>
#include <vector>
#include <stdint.h>

class FileStore {
public:
    virtual ~FileStore()
    {
    }

    virtual bool exists(const std::string& path) = 0;

    // true if the file is gone afterwards, including when it never existed
    virtual bool unlink(const std::string& path) = 0;

    // names only, no "." / "..". A missing directory lists as empty.
    virtual bool listDirectory(const std::string& path, std::vector<std::string>& r_names) = 0;

    virtual bool stat(const std::string& path, uint64_t& r_size) = 0;

    // creates parents as needed; true if the directory exists afterwards
    virtual bool makeDirectory(const std::string& path) = 0;
};

#endif /*BASE_FILESTORE_H_*/
