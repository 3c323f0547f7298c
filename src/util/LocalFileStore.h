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

#ifndef UTIL_LOCALFILESTORE_H_
#define UTIL_LOCALFILESTORE_H_

#include <base/FileStore.h>

//! FileStore over the local filesystem
class LocalFileStore: public FileStore {
public:
    LocalFileStore();
    virtual ~LocalFileStore();

    virtual bool exists(const std::string& path);
    virtual bool unlink(const std::string& path);
    virtual bool listDirectory(const std::string& path, std::vector<std::string>& r_names);
    virtual bool stat(const std::string& path, uint64_t& r_size);
    virtual bool makeDirectory(const std::string& path);
};

#endif /* UTIL_LOCALFILESTORE_H_ */
