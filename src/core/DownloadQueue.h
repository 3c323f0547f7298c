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

#ifndef CORE_DOWNLOADQUEUE_H_
#define CORE_DOWNLOADQUEUE_H_

#include <list>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <stdint.h>

#include <base/DownloadProvider.h>
#include <base/DownloadTask.h>
#include <base/FileStore.h>
#include <base/NetworkMonitor.h>
#include <base/QueueRecord.h>
#include <base/RecordStore.h>
#include <base/TimerScheduler.h>
#include <core/DeletionScheduler.h>
#include <core/NetworkArbiter.h>
#include <core/RetryEngine.h>

enum QueueStatus {
    QueueStatus_OK = 0,
    QueueStatus_ALREADYINITIALIZED = -1,
    QueueStatus_NOTINITIALIZED = -2,
    QueueStatus_INVALIDCONFIG = -3,
    QueueStatus_STOREERROR = -4,
    QueueStatus_NETWORKERROR = -5
};

struct QueueHandlers {
    std::function<void(const std::string& url, uint64_t totalBytes)> onBegin;
    std::function<void(const std::string& url, double fraction, uint64_t bytesWritten, uint64_t totalBytes)> onProgress;
    std::function<void(const std::string& url, const std::string& localPath)> onDone;
    std::function<void(const std::string& url)> onWillRemove;
    std::function<void(const std::string& url, const std::string& error)> onError;
};

struct QueueOptions {
    QueueOptions()
        : domain("main"),
          basePath("/media/internal/downloadqueue"),
          networkMonitor(NULL),
          startActive(true),
          keepExtension(true),
          retryIntervalMs(RetryEngine::DEFAULT_INTERVAL_MS)
    {
    }

    std::string domain;
    std::string basePath;
    QueueHandlers handlers;
    NetworkMonitor* networkMonitor;                 // optional, not owned
    std::vector<std::string> activeNetworkTypes;    // empty: any connection will do
    bool startActive;
    bool keepExtension;
    int64_t retryIntervalMs;
};

struct QueueItemStatus {
    QueueItemStatus()
        : complete(false)
    {
    }

    std::string url;
    std::string path;
    bool complete;
};

// Keeps a set of urls mirrored as local files across restarts.
//
// The collaborators are not owned and must outlive the queue. All calls,
// task callbacks and timers are expected on the same glib main loop.
class DownloadQueue {
public:
    DownloadQueue(DownloadProvider* provider, FileStore* fileStore, RecordStore* recordStore, TimerScheduler* timers);
    virtual ~DownloadQueue();

    //! Rebuild state from the record store, the provider's in-flight tasks and
    //! the files on disk. Must succeed before anything else is called.
    QueueStatus init(const QueueOptions& options);

    //! Stop all transfers and forget in-memory state. Records are kept.
    void terminate();

    QueueStatus addUrl(const std::string& url);

    //! deleteTime < 0 removes now, 0 on the next init, > 0 at that epoch ms
    QueueStatus removeUrl(const std::string& url, int64_t deleteTime = -1);

    //! Make the active set exactly `urls`
    QueueStatus setQueue(const std::vector<std::string>& urls, int64_t deleteTime = -1);

    bool getStatus(const std::string& url, QueueItemStatus& r_status);
    QueueStatus getQueueStatus(std::vector<QueueItemStatus>& r_statuses);

    //! Local path once the download is complete, the url itself otherwise
    QueueStatus getAvailableUrl(const std::string& url, std::string& r_url);

    QueueStatus pauseAll();
    QueueStatus resumeAll();
    QueueStatus setActiveNetworkTypes(const std::vector<std::string>& types);

    bool isInitialized() const
    {
        return m_initialized;
    }

    bool isActive() const
    {
        return m_initialized && !m_arbiter.isPaused();
    }

private:
    struct TaskSlot {
        TaskSlot()
            : serial(0)
        {
        }

        TaskSlot(const std::shared_ptr<DownloadTask>& t, unsigned long s)
            : task(t), serial(s)
        {
        }

        std::shared_ptr<DownloadTask> task;
        unsigned long serial;       // tells re-attached tasks for the same id apart
    };

    typedef std::list<QueueRecord> RecordList;
    typedef std::map<std::string, TaskSlot> TaskMap;

    // startup (DownloadQueueStartup.cpp)
    QueueStatus validateOptions(const QueueOptions& options);
    bool loadRecords(std::vector<QueueRecord>& r_records);
    bool purgeDueRecords(std::vector<QueueRecord>& records, int64_t now);
    void reviveTasks(std::vector<std::shared_ptr<DownloadTask> >& tasks, std::set<std::string>& r_handledIds);
    void startMissingTransfers(const std::set<std::string>& handledIds);
    void deleteOrphanFiles(const std::vector<std::string>& filenames);
    void scheduleDeadlines();
    QueueStatus startNetworkMonitoring();
    void rollbackInit();

    QueueRecord* findById(const std::string& id);
    QueueRecord* findByUrl(const std::string& url);
    bool eraseRecord(const std::string& id);

    bool persist(const QueueRecord& record);
    std::string storageKey(const std::string& id) const;

    void startTransfer(const std::string& id);
    // a removal that could not be stored leaves the record queued; get its
    // transfer going again
    void restartKeptRecord(const std::string& id);
    void attachTask(const std::string& id, const std::shared_ptr<DownloadTask>& task);
    std::shared_ptr<DownloadTask> detachTask(const std::string& id);
    void stopTask(const std::string& id);
    void stopAllTasks();

    QueueRecord* liveRecord(const std::weak_ptr<int>& session, const std::string& id, unsigned long serial, const char* event);
    void onTaskBegin(const std::weak_ptr<int>& session, const std::string& id, unsigned long serial, uint64_t totalBytes);
    void onTaskProgress(const std::weak_ptr<int>& session, const std::string& id, unsigned long serial, double fraction, uint64_t bytesWritten, uint64_t totalBytes);
    void onTaskDone(const std::weak_ptr<int>& session, const std::string& id, unsigned long serial);
    void onTaskError(const std::weak_ptr<int>& session, const std::string& id, unsigned long serial, const std::string& message, int code);

    void onRetry(const std::string& id);
    void onDeletionWake();
    void onNetworkState(const std::weak_ptr<int>& session, const NetworkState& state);
    void applyPause(bool paused);

    void notifyBegin(const std::string& url, uint64_t totalBytes);
    void notifyDone(const std::string& url, const std::string& path);
    void notifyWillRemove(const std::string& url);
    void notifyError(const std::string& url, const std::string& error);

    DownloadProvider* m_provider;
    FileStore* m_fileStore;
    RecordStore* m_recordStore;
    TimerScheduler* m_timers;

    QueueOptions m_options;
    std::string m_domainDirectory;
    bool m_initialized;

    RecordList m_records;           // insertion order
    TaskMap m_tasks;                // record id -> live task
    unsigned long m_taskSerial;

    RetryEngine m_retry;
    DeletionScheduler m_deletion;
    NetworkArbiter m_arbiter;
    unsigned long m_networkSubscription;

    // alive for the duration of one init..terminate session
    std::shared_ptr<int> m_session;
};

#endif /* CORE_DOWNLOADQUEUE_H_ */
