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

#ifndef BASE_RECORDSTORE_H_
#define BASE_RECORDSTORE_H_

#include <string>
#include <vector>
#include <utility>

// Key/value persistence for queue records. Keys are "{domain}/{id}",
// values are serialized record json.
class RecordStore {
public:
    typedef std::pair<std::string, std::string> Entry;

    virtual ~RecordStore()
    {
    }

    virtual bool write(const std::string& key, const std::string& value) = 0;

    // all or nothing
    virtual bool writeMulti(const std::vector<Entry>& entries) = 0;

    virtual bool readAll(const std::string& keyPrefix, std::vector<Entry>& r_entries) = 0;

    virtual bool remove(const std::string& key) = 0;

    // all or nothing
    virtual bool removeMulti(const std::vector<std::string>& keys) = 0;
};

#endif /*BASE_RECORDSTORE_H_*/
