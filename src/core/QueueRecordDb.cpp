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

#include <core/QueueRecordDb.h>
#include <glib.h>
#include <cstring>
#include <strings.h>
#include <unistd.h>
#include <util/Logging.h>

#define VALID_SCHEMA_VER    "queue-1"

// the schema version lives in a reserved row; its key can't collide with "{domain}/{id}"
static const char* s_schemaKey = "#schema";

QueueRecordDb::QueueRecordDb(const std::string& dbPath)
    : m_dbPath(dbPath),
      m_db(0)
{
}

QueueRecordDb::~QueueRecordDb()
{
    close();
}

bool QueueRecordDb::open(std::string& errmsg)
{
    if (m_db)
        return true;

    gchar* dirPath = g_path_get_dirname(m_dbPath.c_str());
    g_mkdir_with_parents(dirPath, 0755);
    g_free(dirPath);

    int ret = sqlite3_open(m_dbPath.c_str(), &m_db);
    if (ret) {
        errmsg = "Failed to open queue record db";
        if (m_db) {
            sqlite3_close(m_db);
            m_db = 0;
        }
        LOG_WARNING_PAIRS_ONLY(LOGID_DB_OPEN_ERROR, 2, PMLOGKS("path", m_dbPath.c_str()), PMLOGKS("detail", errmsg.c_str()));
        return false;
    }

    if (!checkTableConsistency()) {
        errmsg = "Failed to create QueueRecords table";
        close();
        LOG_WARNING_PAIRS_ONLY(LOGID_DB_OPEN_ERROR, 2, PMLOGKS("path", m_dbPath.c_str()), PMLOGKS("detail", errmsg.c_str()));
        return false;
    }

    ret = sqlite3_exec(m_db, "PRAGMA temp_store=FILE;", NULL, NULL, NULL);
    if (ret) {
        LOG_DEBUG("Failed to set PRAGMA temp_store!!");
    }

    return true;
}

void QueueRecordDb::close()
{
    if (!m_db)
        return;

    (void) sqlite3_close(m_db);
    m_db = 0;
}

bool QueueRecordDb::write(const std::string& key, const std::string& value)
{
    if (!m_db || key.empty())
        return false;

    char* queryStr = sqlite3_mprintf("REPLACE INTO QueueRecords VALUES (%Q, %Q)", key.c_str(), value.c_str());
    if (!queryStr)
        return false;

    bool ok = execute(queryStr);
    sqlite3_free(queryStr);
    return ok;
}

bool QueueRecordDb::writeMulti(const std::vector<Entry>& entries)
{
    if (!m_db)
        return false;
    if (entries.empty())
        return true;

    if (!beginTransaction())
        return false;

    for (std::vector<Entry>::const_iterator it = entries.begin(); it != entries.end(); ++it) {
        if (!write(it->first, it->second)) {
            rollbackTransaction();
            return false;
        }
    }

    return commitTransaction();
}

bool QueueRecordDb::readAll(const std::string& keyPrefix, std::vector<Entry>& r_entries)
{
    sqlite3_stmt* statement = 0;
    const char* tail = 0;
    int ret = 0;
    bool resultOk = false;
    char* queryStr = 0;

    if (!m_db)
        return false;

    // plain substring compare, so '*', '?' and '[' in a domain match only themselves
    queryStr = sqlite3_mprintf("SELECT key, record FROM QueueRecords WHERE substr(key, 1, length(%Q)) = %Q AND key != %Q ORDER BY rowid",
            keyPrefix.c_str(), keyPrefix.c_str(), s_schemaKey);
    if (!queryStr)
        goto Done;

    ret = sqlite3_prepare_v2(m_db, queryStr, -1, &statement, &tail);
    if (ret) {
        LOG_WARNING_PAIRS(LOGID_DB_STMT_PREPARE_FAIL, 1, PMLOGKS("statement", queryStr), "Failed to prepare sql statement");
        goto Done;
    }

    ret = sqlite3_step(statement);
    while (ret == SQLITE_ROW) {
        const char* key = (const char*) sqlite3_column_text(statement, 0);
        const char* record = (const char*) sqlite3_column_text(statement, 1);
        if (key && record)
            r_entries.push_back(Entry(key, record));
        ret = sqlite3_step(statement);
    }
    resultOk = (ret == SQLITE_DONE);
    if (!resultOk)
        LOG_WARNING_PAIRS(LOGID_DB_EXEC_FAIL, 1, PMLOGKS("error", sqlite3_errmsg(m_db)), "Failed to read queue records");

Done:

    if (statement)
        sqlite3_finalize(statement);

    if (queryStr)
        sqlite3_free(queryStr);

    return resultOk;
}

bool QueueRecordDb::remove(const std::string& key)
{
    if (!m_db || key.empty())
        return false;

    char* queryStr = sqlite3_mprintf("DELETE FROM QueueRecords WHERE key = %Q", key.c_str());
    if (!queryStr)
        return false;

    bool ok = execute(queryStr);
    sqlite3_free(queryStr);
    return ok;
}

bool QueueRecordDb::removeMulti(const std::vector<std::string>& keys)
{
    if (!m_db)
        return false;
    if (keys.empty())
        return true;

    if (!beginTransaction())
        return false;

    for (std::vector<std::string>::const_iterator it = keys.begin(); it != keys.end(); ++it) {
        if (!remove(*it)) {
            rollbackTransaction();
            return false;
        }
    }

    return commitTransaction();
}

bool QueueRecordDb::clear()
{
    if (!m_db)
        return false;

    char* queryStr = sqlite3_mprintf("DELETE FROM QueueRecords WHERE key != %Q", s_schemaKey);
    if (!queryStr)
        return false;

    bool ok = execute(queryStr);
    sqlite3_free(queryStr);
    return ok;
}

bool QueueRecordDb::execute(const char* queryStr)
{
    char* errmsg = 0;
    int ret = sqlite3_exec(m_db, queryStr, NULL, NULL, &errmsg);
    if (ret) {
        LOG_WARNING_PAIRS(LOGID_DB_EXEC_FAIL, 2, PMLOGKS("statement", queryStr), PMLOGKS("error", errmsg ? errmsg : "unknown"), "Failed to execute query");
        if (errmsg)
            sqlite3_free(errmsg);
        return false;
    }
    return true;
}

bool QueueRecordDb::beginTransaction()
{
    return execute("BEGIN IMMEDIATE TRANSACTION");
}

bool QueueRecordDb::commitTransaction()
{
    if (execute("COMMIT TRANSACTION"))
        return true;
    rollbackTransaction();
    return false;
}

void QueueRecordDb::rollbackTransaction()
{
    (void) sqlite3_exec(m_db, "ROLLBACK TRANSACTION", NULL, NULL, NULL);
}

bool QueueRecordDb::checkTableConsistency()
{
    if (!m_db)
        return false;

    int ret;
    sqlite3_stmt* statement = 0;
    const char* tail = 0;
    char* queryStr = 0;

    //check integrity
    if (!integrityCheckDb()) {
        LOG_WARNING_PAIRS_ONLY(LOGID_DB_INTEGRITY_ERROR, 1, PMLOGKS("integrityCheckDb", "failed to check record DB integrity and couldn't recreate it"));
        return false;
    }

    queryStr = sqlite3_mprintf("SELECT record FROM QueueRecords WHERE key = %Q", s_schemaKey);
    if (!queryStr)
        return false;

    ret = sqlite3_prepare_v2(m_db, queryStr, -1, &statement, &tail);
    sqlite3_free(queryStr);
    if (ret) {
        LOG_DEBUG("Failed to prepare schema query (%s)", sqlite3_errmsg(m_db));
        goto Recreate;
    }

    ret = sqlite3_step(statement);
    if (ret == SQLITE_ROW) {
        const char* ver = (const char*) sqlite3_column_text(statement, 0);
        std::string version;
        if (ver != NULL)
            version = ver;
        if (version == VALID_SCHEMA_VER) {
            sqlite3_finalize(statement);
            return true;
        }
        LOG_DEBUG("Database is the wrong schema version [%s], and should be [%s]", version.c_str(), VALID_SCHEMA_VER);
    }

    // Database not consistent. recreate

Recreate:

    if (statement)
        sqlite3_finalize(statement);

    (void) sqlite3_exec(m_db, "DROP TABLE IF EXISTS QueueRecords", NULL, NULL, NULL);
    ret = sqlite3_exec(m_db, "CREATE TABLE QueueRecords "
            "(key TEXT PRIMARY KEY, "
            " record TEXT);", NULL, NULL, NULL);
    if (ret) {
        LOG_WARNING_PAIRS(LOGID_DB_RECREATION_FAIL, 1, PMLOGKS("query", "sqlite3_exec"), "failed to create QueueRecords table");
        return false;
    }

    queryStr = sqlite3_mprintf("INSERT INTO QueueRecords VALUES (%Q, %Q)", s_schemaKey, VALID_SCHEMA_VER);
    if (!queryStr)
        return false;

    ret = sqlite3_exec(m_db, queryStr, NULL, NULL, NULL);
    sqlite3_free(queryStr);

    if (ret) {
        LOG_WARNING_PAIRS(LOGID_DB_RECREATION_FAIL, 1, PMLOGKS("query", "sqlite3_exec"), "failed to insert schema row into QueueRecords table");
        return false;
    }

    return true;
}

bool QueueRecordDb::integrityCheckDb()
{
    if (!m_db)
        return false;

    sqlite3_stmt* statement = 0;
    const char* tail = 0;
    int ret = 0;
    bool integrityOk = false;

    ret = sqlite3_prepare_v2(m_db, "PRAGMA integrity_check", -1, &statement, &tail);
    if (ret) {
        LOG_DEBUG("Failed to prepare sql statement for integrity_check");
        goto CorruptDb;
    }

    ret = sqlite3_step(statement);
    if (ret == SQLITE_ROW) {
        const unsigned char* result = sqlite3_column_text(statement, 0);
        if (result && strcasecmp((const char*) result, "ok") == 0)
            integrityOk = true;
    }

    sqlite3_finalize(statement);

    if (!integrityOk)
        goto CorruptDb;

    LOG_DEBUG("%s: Integrity check for database passed", __PRETTY_FUNCTION__);

    return true;

CorruptDb:

    LOG_DEBUG("%s: integrity check failed. recreating database", __PRETTY_FUNCTION__);

    sqlite3_close(m_db);
    m_db = 0;
    unlink(m_dbPath.c_str());

    ret = sqlite3_open_v2(m_dbPath.c_str(), &m_db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, NULL);
    if (ret) {
        LOG_DEBUG("%s: Failed to re-open queue record db at [%s]", __PRETTY_FUNCTION__, m_dbPath.c_str());
        if (m_db) {
            sqlite3_close(m_db);
            m_db = 0;
        }
        return false;
    }

    return true;
}
