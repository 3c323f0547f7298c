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

#ifndef CORE_QUEUERECORDDB_H_
#define CORE_QUEUERECORDDB_H_

#include <string>
#include <vector>
#include <sqlite3.h>

#include <base/RecordStore.h>

//! RecordStore backed by a single sqlite table
class QueueRecordDb: public RecordStore {
public:
    explicit QueueRecordDb(const std::string& dbPath);
    virtual ~QueueRecordDb();

    //! Opens (creating or recreating as needed) the database. Idempotent.
    bool open(std::string& errmsg);
    void close();

    bool isOpen() const
    {
        return m_db != 0;
    }

    virtual bool write(const std::string& key, const std::string& value);
    virtual bool writeMulti(const std::vector<Entry>& entries);
    virtual bool readAll(const std::string& keyPrefix, std::vector<Entry>& r_entries);
    virtual bool remove(const std::string& key);
    virtual bool removeMulti(const std::vector<std::string>& keys);

    //! Drop every record (schema row survives)
    bool clear();

private:
    bool checkTableConsistency();
    bool integrityCheckDb();

    bool execute(const char* queryStr);
    bool beginTransaction();
    bool commitTransaction();
    void rollbackTransaction();

    std::string m_dbPath;
    sqlite3* m_db;
};

#endif /* CORE_QUEUERECORDDB_H_ */
