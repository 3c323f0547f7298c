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

#include "support/QueueTestFixture.h"

class DownloadQueueInitTest: public QueueTestFixture {
};

TEST_F(DownloadQueueInitTest, SecondInitIsRejected)
{
    ASSERT_EQ(QueueStatus_OK, m_queue.init(options()));
    EXPECT_EQ(QueueStatus_ALREADYINITIALIZED, m_queue.init(options()));
    EXPECT_TRUE(m_queue.isInitialized());
}

TEST_F(DownloadQueueInitTest, InvalidOptionsAreRejected)
{
    QueueOptions opts = options();
    opts.domain = "";
    EXPECT_EQ(QueueStatus_INVALIDCONFIG, m_queue.init(opts));

    opts = options();
    opts.domain = "a/b";
    EXPECT_EQ(QueueStatus_INVALIDCONFIG, m_queue.init(opts));

    opts = options();
    opts.activeNetworkTypes.push_back("wifi");
    EXPECT_EQ(QueueStatus_INVALIDCONFIG, m_queue.init(opts));

    EXPECT_FALSE(m_queue.isInitialized());
    EXPECT_EQ(QueueStatus_OK, m_queue.init(options()));
}

TEST_F(DownloadQueueInitTest, MissingCollaboratorIsInvalidConfig)
{
    DownloadQueue queue(&m_provider, &m_files, NULL, &m_timers);
    EXPECT_EQ(QueueStatus_INVALIDCONFIG, queue.init(options()));
}

TEST_F(DownloadQueueInitTest, UnreadableStoreFailsInit)
{
    seedActive("r1", "http://a/1.mp3");
    m_store.m_failReads = true;

    EXPECT_EQ(QueueStatus_STOREERROR, m_queue.init(options()));
    EXPECT_FALSE(m_queue.isInitialized());
    EXPECT_TRUE(m_provider.m_started.empty());
}

TEST_F(DownloadQueueInitTest, FailedPurgeFailsInit)
{
    QueueRecord record = seedActive("r1", "http://a/1.mp3");
    record.markForDeletion(0);
    seed(record);
    m_store.m_failRemoves = true;

    EXPECT_EQ(QueueStatus_STOREERROR, m_queue.init(options()));
    EXPECT_FALSE(m_queue.isInitialized());
}

TEST_F(DownloadQueueInitTest, NetworkFetchFailureRollsBack)
{
    seedActive("r1", "http://a/1.mp3");
    m_network.m_fetchFails = true;

    EXPECT_EQ(QueueStatus_NETWORKERROR, m_queue.init(networkOptions(std::vector<std::string>())));
    EXPECT_FALSE(m_queue.isInitialized());

    // the transfer started on the way is stopped again
    ASSERT_EQ(1u, m_provider.m_started.size());
    EXPECT_EQ(1, m_provider.m_started[0]->m_stopCount);
    EXPECT_EQ(0u, m_network.subscriberCount());
    EXPECT_EQ(0u, m_timers.pendingCount());

    std::vector<QueueItemStatus> statuses;
    EXPECT_EQ(QueueStatus_NOTINITIALIZED, m_queue.getQueueStatus(statuses));
}

TEST_F(DownloadQueueInitTest, UnparseableRowsAreSkipped)
{
    m_store.put("test/broken", "{not json");
    seedActive("r1", "http://a/1.mp3");

    ASSERT_EQ(QueueStatus_OK, m_queue.init(options()));

    std::vector<QueueItemStatus> statuses;
    ASSERT_EQ(QueueStatus_OK, m_queue.getQueueStatus(statuses));
    ASSERT_EQ(1u, statuses.size());
    EXPECT_EQ("http://a/1.mp3", statuses[0].url);
}

TEST_F(DownloadQueueInitTest, OtherDomainsAreInvisible)
{
    QueueRecord other("x1", "http://a/other.mp3", "/data/dq/other/x1.mp3", 5);
    m_store.put(QueueRecord::storageKey("other", "x1"), other.toJSONString());

    ASSERT_EQ(QueueStatus_OK, m_queue.init(options()));

    QueueItemStatus status;
    EXPECT_FALSE(m_queue.getStatus("http://a/other.mp3", status));
    EXPECT_TRUE(m_provider.m_started.empty());
    EXPECT_TRUE(m_store.has("other/x1"));
}

TEST_F(DownloadQueueInitTest, DueRecordsArePurgedInOneBatch)
{
    QueueRecord nextInit = seedActive("r1", "http://a/1.mp3");
    nextInit.markForDeletion(0);
    seed(nextInit);

    QueueRecord expired = seedActive("r2", "http://a/2.mp3");
    expired.markForDeletion(m_timers.now() - 1);
    seed(expired);

    QueueRecord future = seedActive("r3", "http://a/3.mp3");
    future.markForDeletion(m_timers.now() + 90000);
    seed(future);

    m_files.addFile(nextInit.m_path);
    m_files.addFile(expired.m_path);
    m_files.addFile(future.m_path);

    ASSERT_EQ(QueueStatus_OK, m_queue.init(options()));

    EXPECT_EQ(1, m_store.m_removeMultiCount);
    EXPECT_FALSE(m_store.has("test/r1"));
    EXPECT_FALSE(m_store.has("test/r2"));
    EXPECT_TRUE(m_store.has("test/r3"));

    // purged records lose their files, the pending one keeps its file
    EXPECT_TRUE(m_files.wasUnlinked(nextInit.m_path));
    EXPECT_TRUE(m_files.wasUnlinked(expired.m_path));
    EXPECT_TRUE(m_files.exists(future.m_path));

    // nothing is downloaded for lazily-deleted records
    EXPECT_TRUE(m_provider.m_started.empty());

    // one wake-up for the future deadline
    EXPECT_EQ(1u, m_timers.pendingCount());
    m_timers.advance(120000);
    EXPECT_FALSE(m_store.has("test/r3"));
    EXPECT_FALSE(m_files.exists(future.m_path));
}

TEST_F(DownloadQueueInitTest, InFlightTaskIsReattached)
{
    seedActive("r1", "http://a/1.mp3");
    std::shared_ptr<FakeDownloadTask> task = m_provider.addInFlight("r1", DownloadTask::STATE_DOWNLOADING, 500);

    ASSERT_EQ(QueueStatus_OK, m_queue.init(options()));

    EXPECT_TRUE(m_provider.m_started.empty());
    EXPECT_TRUE(task->hasHandlers());
    EXPECT_EQ(1, task->m_resumeCount);
    EXPECT_EQ(0, task->m_stopCount);
    ASSERT_EQ(1u, m_begins.size());
    EXPECT_EQ("http://a/1.mp3", m_begins[0].first);
    EXPECT_EQ(500u, m_begins[0].second);

    task->fireDone();
    ASSERT_EQ(1u, m_dones.size());
    EXPECT_EQ("/data/dq/test/r1.mp3", m_dones[0].second);
}

TEST_F(DownloadQueueInitTest, InFlightTaskPausedWhenStartingInactive)
{
    seedActive("r1", "http://a/1.mp3");
    std::shared_ptr<FakeDownloadTask> task = m_provider.addInFlight("r1", DownloadTask::STATE_DOWNLOADING);

    QueueOptions opts = options();
    opts.startActive = false;
    ASSERT_EQ(QueueStatus_OK, m_queue.init(opts));

    EXPECT_FALSE(m_queue.isActive());
    EXPECT_EQ(1, task->m_pauseCount);
    EXPECT_EQ(0, task->m_resumeCount);
}

TEST_F(DownloadQueueInitTest, TaskFinishedWhileAwayIsCompleted)
{
    seedActive("r1", "http://a/1.mp3");
    std::shared_ptr<FakeDownloadTask> task = m_provider.addInFlight("r1", DownloadTask::STATE_DONE, 42);

    ASSERT_EQ(QueueStatus_OK, m_queue.init(options()));

    QueueRecord record;
    ASSERT_TRUE(stored("r1", record));
    EXPECT_TRUE(record.m_finished);

    ASSERT_EQ(1u, m_provider.m_completed.size());
    EXPECT_EQ("r1", m_provider.m_completed[0]);
    ASSERT_EQ(1u, m_begins.size());
    EXPECT_EQ(42u, m_begins[0].second);
    ASSERT_EQ(1u, m_dones.size());
    EXPECT_TRUE(m_provider.m_started.empty());

    // not registered, so a late done is ignored
    EXPECT_FALSE(task->hasHandlers());
    task->fireDone();
    EXPECT_EQ(1u, m_dones.size());
}

TEST_F(DownloadQueueInitTest, StoppedTaskGetsFreshTransfer)
{
    seedActive("r1", "http://a/1.mp3");
    std::shared_ptr<FakeDownloadTask> task = m_provider.addInFlight("r1", DownloadTask::STATE_STOPPED);

    ASSERT_EQ(QueueStatus_OK, m_queue.init(options()));

    EXPECT_EQ(1, m_provider.startedCountFor("http://a/1.mp3"));
    EXPECT_EQ("/data/dq/test/r1.mp3", m_provider.m_started[0]->m_destination);
    EXPECT_FALSE(task->hasHandlers());
}

TEST_F(DownloadQueueInitTest, FailedTaskIsReportedAndRetried)
{
    seedActive("r1", "http://a/1.mp3");
    m_provider.addInFlight("r1", DownloadTask::STATE_FAILED);

    ASSERT_EQ(QueueStatus_OK, m_queue.init(options()));

    ASSERT_EQ(1u, m_errors.size());
    EXPECT_EQ("http://a/1.mp3", m_errors[0].first);
    EXPECT_TRUE(m_provider.m_started.empty());
    EXPECT_EQ(1u, m_timers.pendingCount());

    m_timers.advance(60000);
    EXPECT_EQ(1, m_provider.startedCountFor("http://a/1.mp3"));
}

TEST_F(DownloadQueueInitTest, TaskWithoutRecordIsStopped)
{
    std::shared_ptr<FakeDownloadTask> task = m_provider.addInFlight("ghost", DownloadTask::STATE_DOWNLOADING);

    ASSERT_EQ(QueueStatus_OK, m_queue.init(options()));

    EXPECT_EQ(1, task->m_stopCount);
    EXPECT_FALSE(task->hasHandlers());
}

TEST_F(DownloadQueueInitTest, TaskForPendingDeletionLosesPartialFile)
{
    QueueRecord record = seedActive("r1", "http://a/1.mp3");
    record.markForDeletion(m_timers.now() + 600000);
    seed(record);
    m_files.addFile(record.m_path);
    std::shared_ptr<FakeDownloadTask> task = m_provider.addInFlight("r1", DownloadTask::STATE_PAUSED);

    ASSERT_EQ(QueueStatus_OK, m_queue.init(options()));

    EXPECT_EQ(1, task->m_stopCount);
    EXPECT_FALSE(m_files.exists(record.m_path));
    EXPECT_TRUE(m_store.has("test/r1"));
}

TEST_F(DownloadQueueInitTest, TaskForFinishedRecordKeepsFile)
{
    QueueRecord record = seedActive("r1", "http://a/1.mp3", true);
    m_files.addFile(record.m_path);
    std::shared_ptr<FakeDownloadTask> task = m_provider.addInFlight("r1", DownloadTask::STATE_DOWNLOADING);

    ASSERT_EQ(QueueStatus_OK, m_queue.init(options()));

    EXPECT_EQ(1, task->m_stopCount);
    EXPECT_TRUE(m_files.exists(record.m_path));
    EXPECT_TRUE(m_provider.m_started.empty());
}

TEST_F(DownloadQueueInitTest, IdleRecordsAreStarted)
{
    seedActive("r1", "http://a/1.mp3");
    seedActive("r2", "http://a/2.mp3");

    ASSERT_EQ(QueueStatus_OK, m_queue.init(options()));

    ASSERT_EQ(2u, m_provider.m_started.size());
    EXPECT_EQ("r1", m_provider.m_started[0]->m_id);
    EXPECT_EQ("r2", m_provider.m_started[1]->m_id);
}

TEST_F(DownloadQueueInitTest, FinishedRecordWithMissingFileIsDownloadedAgain)
{
    seedActive("r1", "http://a/1.mp3", true);
    QueueRecord kept = seedActive("r2", "http://a/2.mp3", true);
    m_files.addFile(kept.m_path);

    ASSERT_EQ(QueueStatus_OK, m_queue.init(options()));

    EXPECT_EQ(1, m_provider.startedCountFor("http://a/1.mp3"));
    EXPECT_EQ(0, m_provider.startedCountFor("http://a/2.mp3"));

    QueueRecord record;
    ASSERT_TRUE(stored("r1", record));
    EXPECT_FALSE(record.m_finished);

    QueueItemStatus status;
    ASSERT_TRUE(m_queue.getStatus("http://a/2.mp3", status));
    EXPECT_TRUE(status.complete);
}

TEST_F(DownloadQueueInitTest, OrphanFilesAreDeleted)
{
    QueueRecord record = seedActive("r1", "http://a/1.mp3", true);
    m_files.addFile(record.m_path);
    m_files.addFile("/data/dq/test/stray.bin");
    m_files.addFile("/data/dq/test/r1.part.tmp");
    m_files.addFile("/data/dq/other/stray.bin");

    ASSERT_EQ(QueueStatus_OK, m_queue.init(options()));

    EXPECT_TRUE(m_files.exists(record.m_path));
    EXPECT_TRUE(m_files.exists("/data/dq/test/r1.part.tmp"));
    EXPECT_FALSE(m_files.exists("/data/dq/test/stray.bin"));
    EXPECT_TRUE(m_files.exists("/data/dq/other/stray.bin"));
}

TEST_F(DownloadQueueInitTest, DomainDirectoryIsCreated)
{
    ASSERT_EQ(QueueStatus_OK, m_queue.init(options()));
    EXPECT_EQ(1u, m_files.m_directories.count("/data/dq/test"));
}

TEST_F(DownloadQueueInitTest, DisconnectedAtStartupPausesTransfers)
{
    seedActive("r1", "http://a/1.mp3");
    m_network.m_state = NetworkState(false, "none");

    ASSERT_EQ(QueueStatus_OK, m_queue.init(networkOptions(std::vector<std::string>())));

    EXPECT_FALSE(m_queue.isActive());
    ASSERT_EQ(1u, m_provider.m_started.size());
    EXPECT_EQ(1, m_provider.m_started[0]->m_pauseCount);
    EXPECT_EQ(1u, m_network.subscriberCount());

    m_network.emit(true, "wifi");
    EXPECT_TRUE(m_queue.isActive());
    EXPECT_EQ(1, m_provider.m_started[0]->m_resumeCount);
}

TEST_F(DownloadQueueInitTest, ReinitAfterTerminateRestoresCompletion)
{
    ASSERT_EQ(QueueStatus_OK, m_queue.init(options()));
    ASSERT_EQ(QueueStatus_OK, m_queue.addUrl("http://a/x.mp3"));

    std::shared_ptr<FakeDownloadTask> task = m_provider.lastStartedFor("http://a/x.mp3");
    ASSERT_TRUE(task.get() != NULL);
    m_files.addFile(task->m_destination, 10);
    task->fireDone();

    QueueItemStatus before;
    ASSERT_TRUE(m_queue.getStatus("http://a/x.mp3", before));

    m_queue.terminate();
    ASSERT_EQ(QueueStatus_OK, m_queue.init(options()));

    QueueItemStatus after;
    ASSERT_TRUE(m_queue.getStatus("http://a/x.mp3", after));
    EXPECT_EQ(before.complete, after.complete);
    EXPECT_TRUE(after.complete);
    EXPECT_EQ(before.path, after.path);
    EXPECT_EQ(1, m_provider.startedCountFor("http://a/x.mp3"));
}
