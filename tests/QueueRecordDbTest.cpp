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

#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <sqlite3.h>

#include <core/QueueRecordDb.h>

#include "support/TempDir.h"

class QueueRecordDbTest: public ::testing::Test {
protected:
    QueueRecordDbTest()
        : m_dbPath(m_tmp.file("db/records.db"))
    {
    }

    std::vector<RecordStore::Entry> read(QueueRecordDb& db, const std::string& prefix)
    {
        std::vector<RecordStore::Entry> entries;
        EXPECT_TRUE(db.readAll(prefix, entries));
        return entries;
    }

    TempDir m_tmp;
    std::string m_dbPath;
};

TEST_F(QueueRecordDbTest, OpenCreatesDirectoryAndEmptyTable)
{
    QueueRecordDb db(m_dbPath);
    std::string errmsg;

    ASSERT_TRUE(db.open(errmsg));
    EXPECT_TRUE(db.isOpen());
    EXPECT_TRUE(g_file_test(m_dbPath.c_str(), G_FILE_TEST_EXISTS));

    // the schema row is never handed out
    EXPECT_TRUE(read(db, "").empty());

    // opening twice is harmless
    EXPECT_TRUE(db.open(errmsg));
}

TEST_F(QueueRecordDbTest, WriteReplacesByKey)
{
    QueueRecordDb db(m_dbPath);
    std::string errmsg;
    ASSERT_TRUE(db.open(errmsg));

    ASSERT_TRUE(db.write("main/a", "{\"v\":1}"));
    ASSERT_TRUE(db.write("main/a", "{\"v\":2}"));

    std::vector<RecordStore::Entry> entries = read(db, "main/");
    ASSERT_EQ(1u, entries.size());
    EXPECT_EQ("main/a", entries[0].first);
    EXPECT_EQ("{\"v\":2}", entries[0].second);
}

TEST_F(QueueRecordDbTest, ReadAllIsPrefixScopedInInsertionOrder)
{
    QueueRecordDb db(m_dbPath);
    std::string errmsg;
    ASSERT_TRUE(db.open(errmsg));

    ASSERT_TRUE(db.write("main/zz", "1"));
    ASSERT_TRUE(db.write("other/b", "2"));
    ASSERT_TRUE(db.write("main/aa", "3"));
    ASSERT_TRUE(db.write("mainline/c", "4"));

    std::vector<RecordStore::Entry> entries = read(db, "main/");
    ASSERT_EQ(2u, entries.size());
    EXPECT_EQ("main/zz", entries[0].first);
    EXPECT_EQ("main/aa", entries[1].first);
}

TEST_F(QueueRecordDbTest, PrefixWildcardsMatchLiterally)
{
    QueueRecordDb db(m_dbPath);
    std::string errmsg;
    ASSERT_TRUE(db.open(errmsg));

    ASSERT_TRUE(db.write("ab/x", "1"));
    ASSERT_TRUE(db.write("a?/y", "2"));
    ASSERT_TRUE(db.write("a*/z", "3"));
    ASSERT_TRUE(db.write("[a]/w", "4"));

    std::vector<RecordStore::Entry> entries = read(db, "a*/");
    ASSERT_EQ(1u, entries.size());
    EXPECT_EQ("a*/z", entries[0].first);

    entries = read(db, "a?/");
    ASSERT_EQ(1u, entries.size());
    EXPECT_EQ("a?/y", entries[0].first);

    EXPECT_TRUE(read(db, "[ab]/").empty());
}

TEST_F(QueueRecordDbTest, QuotesInValuesSurvive)
{
    QueueRecordDb db(m_dbPath);
    std::string errmsg;
    ASSERT_TRUE(db.open(errmsg));

    std::string value = "{\"url\":\"http://a/it's.mp3\"}";
    ASSERT_TRUE(db.write("main/q", value));

    std::vector<RecordStore::Entry> entries = read(db, "main/");
    ASSERT_EQ(1u, entries.size());
    EXPECT_EQ(value, entries[0].second);
}

TEST_F(QueueRecordDbTest, BatchWriteAndRemove)
{
    QueueRecordDb db(m_dbPath);
    std::string errmsg;
    ASSERT_TRUE(db.open(errmsg));

    std::vector<RecordStore::Entry> batch;
    batch.push_back(RecordStore::Entry("main/a", "1"));
    batch.push_back(RecordStore::Entry("main/b", "2"));
    batch.push_back(RecordStore::Entry("main/c", "3"));
    ASSERT_TRUE(db.writeMulti(batch));
    EXPECT_EQ(3u, read(db, "main/").size());

    std::vector<std::string> keys;
    keys.push_back("main/a");
    keys.push_back("main/c");
    keys.push_back("main/missing");
    ASSERT_TRUE(db.removeMulti(keys));

    std::vector<RecordStore::Entry> entries = read(db, "main/");
    ASSERT_EQ(1u, entries.size());
    EXPECT_EQ("main/b", entries[0].first);

    EXPECT_TRUE(db.writeMulti(std::vector<RecordStore::Entry>()));
    EXPECT_TRUE(db.removeMulti(std::vector<std::string>()));
}

TEST_F(QueueRecordDbTest, RecordsSurviveReopen)
{
    std::string errmsg;
    {
        QueueRecordDb db(m_dbPath);
        ASSERT_TRUE(db.open(errmsg));
        ASSERT_TRUE(db.write("main/a", "1"));
        ASSERT_TRUE(db.remove("main/missing"));
    }

    QueueRecordDb db(m_dbPath);
    ASSERT_TRUE(db.open(errmsg));
    EXPECT_EQ(1u, read(db, "main/").size());
}

TEST_F(QueueRecordDbTest, WrongSchemaVersionIsRecreated)
{
    std::string errmsg;
    {
        QueueRecordDb db(m_dbPath);
        ASSERT_TRUE(db.open(errmsg));
        ASSERT_TRUE(db.write("main/a", "1"));
    }

    sqlite3* raw = 0;
    ASSERT_EQ(SQLITE_OK, sqlite3_open(m_dbPath.c_str(), &raw));
    ASSERT_EQ(SQLITE_OK, sqlite3_exec(raw, "UPDATE QueueRecords SET record = 'queue-0' WHERE key = '#schema'", NULL, NULL, NULL));
    sqlite3_close(raw);

    QueueRecordDb db(m_dbPath);
    ASSERT_TRUE(db.open(errmsg));
    EXPECT_TRUE(read(db, "main/").empty());
}

TEST_F(QueueRecordDbTest, CorruptFileIsRecreated)
{
    ASSERT_EQ(0, g_mkdir_with_parents(m_tmp.file("db").c_str(), 0755));
    ASSERT_TRUE(m_tmp.write("db/records.db", "this is not a database, just some text padding it out a little"));

    QueueRecordDb db(m_dbPath);
    std::string errmsg;
    ASSERT_TRUE(db.open(errmsg));
    EXPECT_TRUE(read(db, "").empty());
    EXPECT_TRUE(db.write("main/a", "1"));
}

TEST_F(QueueRecordDbTest, ClearDropsRecordsOnly)
{
    QueueRecordDb db(m_dbPath);
    std::string errmsg;
    ASSERT_TRUE(db.open(errmsg));
    ASSERT_TRUE(db.write("main/a", "1"));
    ASSERT_TRUE(db.write("other/b", "2"));

    ASSERT_TRUE(db.clear());
    EXPECT_TRUE(read(db, "").empty());

    // schema row kept, so a reopen keeps writes made after the clear
    ASSERT_TRUE(db.write("main/c", "3"));
    db.close();
    ASSERT_TRUE(db.open(errmsg));
    EXPECT_EQ(1u, read(db, "main/").size());
}

TEST_F(QueueRecordDbTest, ClosedDbRefusesEverything)
{
    QueueRecordDb db(m_dbPath);
    std::vector<RecordStore::Entry> entries;

    EXPECT_FALSE(db.isOpen());
    EXPECT_FALSE(db.write("main/a", "1"));
    EXPECT_FALSE(db.readAll("main/", entries));
    EXPECT_FALSE(db.remove("main/a"));
    EXPECT_FALSE(db.writeMulti(std::vector<RecordStore::Entry>(1, RecordStore::Entry("main/a", "1"))));
    EXPECT_FALSE(db.removeMulti(std::vector<std::string>(1, "main/a")));
    EXPECT_FALSE(db.clear());
}
