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

#ifndef BASE_QUEUERECORD_H_
#define BASE_QUEUERECORD_H_

#include <string>
#include <stdint.h>
#include <pbnjson.hpp>

// Persisted state for one queued url
class QueueRecord {
public:
    enum DeletionState {
        DELETION_NONE,              // active
        DELETION_ON_NEXT_INIT,
        DELETION_AT                 // purge once m_deleteAt has passed
    };

    QueueRecord()
        : m_createTime(0),
          m_deletionState(DELETION_NONE),
          m_deleteAt(0),
          m_finished(false)
    {
    }

    QueueRecord(const std::string& id, const std::string& url, const std::string& path, int64_t createTime)
        : m_id(id),
          m_url(url),
          m_path(path),
          m_createTime(createTime),
          m_deletionState(DELETION_NONE),
          m_deleteAt(0),
          m_finished(false)
    {
    }

    bool isActive() const
    {
        return m_deletionState == DELETION_NONE;
    }

    // true for records that must be purged at startup or by a deletion timer
    bool isDueForPurge(int64_t now) const;

    void markActive(int64_t now);

    // deleteTime == 0: next init, deleteTime > 0: at that epoch ms
    void markForDeletion(int64_t deleteTime);

    pbnjson::JValue toJSON() const;
    std::string toJSONString() const;

    //! false if the json is not a usable record
    static bool fromJSON(const pbnjson::JValue& json, QueueRecord& r_record);
    static bool fromJSONString(const std::string& jsonString, QueueRecord& r_record);

    static std::string storageKey(const std::string& domain, const std::string& id);

    //! {basePath}/{domain}/{id}[.ext]
    static std::string destinationPath(const std::string& basePath, const std::string& domain, const std::string& id, const std::string& url, bool keepExtension);

    static std::string generateId();

    std::string m_id;
    std::string m_url;
    std::string m_path;
    int64_t m_createTime;
    DeletionState m_deletionState;
    int64_t m_deleteAt;
    bool m_finished;
};

#endif /* BASE_QUEUERECORD_H_ */
