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

#include <core/DownloadQueue.h>
#include <util/DownloadUtils.h>
#include <util/Logging.h>

using namespace std::placeholders;

QueueStatus DownloadQueue::init(const QueueOptions& options)
{
    if (m_initialized) {
        LOG_WARNING_PAIRS(LOGID_QUEUE_INIT_FAIL, 1, PMLOGKS("reason", "already initialized"), "");
        return QueueStatus_ALREADYINITIALIZED;
    }

    QueueStatus status = validateOptions(options);
    if (status != QueueStatus_OK)
        return status;

    m_options = options;
    m_domainDirectory = joinPath(options.basePath, options.domain);
    m_session = std::make_shared<int>(0);

    m_retry.clear();
    m_retry.setInterval(options.retryIntervalMs);
    m_arbiter.reset(!options.startActive, options.activeNetworkTypes);
    if (m_arbiter.isPaused())
        m_retry.suspend();
    else
        m_retry.unsuspend();

    int64_t now = m_timers->now();

    std::vector<QueueRecord> records;
    std::vector<std::shared_ptr<DownloadTask> > tasks;
    std::vector<std::string> filenames;

    if (!loadRecords(records)) {
        LOG_ERROR_PAIRS(LOGID_QUEUE_INIT_FAIL, 1, PMLOGKS("reason", "failed to read records"), "");
        rollbackInit();
        return QueueStatus_STOREERROR;
    }
    m_provider->listInFlightTasks(tasks);
    if (!m_fileStore->listDirectory(m_domainDirectory, filenames)) {
        LOG_DEBUG("%s: could not list %s, assuming no files", __FUNCTION__, m_domainDirectory.c_str());
        filenames.clear();
    }

    if (!purgeDueRecords(records, now)) {
        LOG_ERROR_PAIRS(LOGID_QUEUE_INIT_FAIL, 1, PMLOGKS("reason", "failed to purge records"), "");
        rollbackInit();
        return QueueStatus_STOREERROR;
    }
    m_records.assign(records.begin(), records.end());

    std::set<std::string> handledIds;
    reviveTasks(tasks, handledIds);
    startMissingTransfers(handledIds);
    deleteOrphanFiles(filenames);
    scheduleDeadlines();

    status = startNetworkMonitoring();
    if (status != QueueStatus_OK) {
        LOG_ERROR_PAIRS(LOGID_QUEUE_INIT_FAIL, 1, PMLOGKS("reason", "network state unavailable"), "");
        rollbackInit();
        return status;
    }

    if (!m_fileStore->makeDirectory(m_domainDirectory))
        LOG_WARNING_PAIRS(LOGID_QUEUE_INIT, 1, PMLOGKS("directory", m_domainDirectory.c_str()), "failed to create download directory");

    m_initialized = true;
    LOG_INFO_PAIRS_ONLY(LOGID_QUEUE_INIT, 4,
            PMLOGKS("domain", m_options.domain.c_str()),
            PMLOGKFV("records", "%zu", m_records.size()),
            PMLOGKFV("tasks", "%zu", m_tasks.size()),
            PMLOGKFV("active", "%d", !m_arbiter.isPaused()));
    return QueueStatus_OK;
}

QueueStatus DownloadQueue::validateOptions(const QueueOptions& options)
{
    if (!m_provider || !m_fileStore || !m_recordStore || !m_timers) {
        LOG_ERROR_PAIRS(LOGID_QUEUE_INVALID_CONFIG, 1, PMLOGKS("reason", "missing collaborator"), "");
        return QueueStatus_INVALIDCONFIG;
    }

    if (options.domain.empty() || options.domain.find('/') != std::string::npos || options.basePath.empty()) {
        LOG_ERROR_PAIRS(LOGID_QUEUE_INVALID_CONFIG, 2, PMLOGKS("domain", options.domain.c_str()), PMLOGKS("basePath", options.basePath.c_str()), "");
        return QueueStatus_INVALIDCONFIG;
    }

    if (!options.activeNetworkTypes.empty() && !options.networkMonitor) {
        LOG_ERROR_PAIRS(LOGID_QUEUE_INVALID_CONFIG, 1, PMLOGKS("reason", "activeNetworkTypes without a network monitor"), "");
        return QueueStatus_INVALIDCONFIG;
    }

    return QueueStatus_OK;
}

bool DownloadQueue::loadRecords(std::vector<QueueRecord>& r_records)
{
    std::vector<RecordStore::Entry> entries;
    if (!m_recordStore->readAll(m_options.domain + "/", entries))
        return false;

    for (std::vector<RecordStore::Entry>::iterator it = entries.begin(); it != entries.end(); ++it) {
        QueueRecord record;
        if (!QueueRecord::fromJSONString(it->second, record)) {
            LOG_WARNING_PAIRS(LOGID_RECORD_PARSE_FAIL, 1, PMLOGKS("key", it->first.c_str()), "skipping record");
            continue;
        }
        r_records.push_back(record);
    }
    return true;
}

bool DownloadQueue::purgeDueRecords(std::vector<QueueRecord>& records, int64_t now)
{
    std::vector<QueueRecord> kept;
    std::vector<std::string> keys;
    for (std::vector<QueueRecord>::iterator it = records.begin(); it != records.end(); ++it) {
        if (it->isDueForPurge(now))
            keys.push_back(storageKey(it->m_id));
        else
            kept.push_back(*it);
    }

    if (keys.empty())
        return true;

    if (!m_recordStore->removeMulti(keys))
        return false;

    // their files go with the orphan sweep
    LOG_INFO_PAIRS_ONLY(LOGID_RECORD_PURGE, 1, PMLOGKFV("count", "%zu", keys.size()));
    records.swap(kept);
    return true;
}

void DownloadQueue::reviveTasks(std::vector<std::shared_ptr<DownloadTask> >& tasks, std::set<std::string>& r_handledIds)
{
    for (std::vector<std::shared_ptr<DownloadTask> >::iterator it = tasks.begin(); it != tasks.end(); ++it) {
        std::shared_ptr<DownloadTask> task = *it;
        if (!task)
            continue;

        std::string id = task->id();
        DownloadTask::State state = task->state();
        QueueRecord* record = findById(id);

        bool alreadyOwned = m_tasks.find(id) != m_tasks.end() || r_handledIds.find(id) != r_handledIds.end();
        if (!record || !record->isActive() || record->m_finished || alreadyOwned) {
            LOG_INFO_PAIRS_ONLY(LOGID_DOWNLOAD_ORPHAN_TASK, 2, PMLOGKS("id", id.c_str()), PMLOGKS("state", DownloadTask::stateName(state)));
            task->stop();

            bool partial = (state == DownloadTask::STATE_DOWNLOADING || state == DownloadTask::STATE_PAUSED);
            if (partial && record && !record->isActive() && !record->m_finished)
                (void) m_fileStore->unlink(record->m_path);
            continue;
        }

        std::string url = record->m_url;

        switch (state) {
        case DownloadTask::STATE_DOWNLOADING:
        case DownloadTask::STATE_PAUSED:
            LOG_INFO_PAIRS_ONLY(LOGID_DOWNLOAD_REVIVE, 2, PMLOGKS("id", id.c_str()), PMLOGKS("state", DownloadTask::stateName(state)));
            attachTask(id, task);
            notifyBegin(url, task->bytesTotal());
            if (m_arbiter.isPaused())
                task->pause();
            else
                task->resume();
            break;

        case DownloadTask::STATE_DONE: {
            QueueRecord finished = *record;
            finished.m_finished = true;
            (void) persist(finished);
            *record = finished;
            r_handledIds.insert(id);

            m_provider->completeTransfer(id);
            LOG_INFO_PAIRS_ONLY(LOGID_DOWNLOAD_COMPLETE, 2, PMLOGKS("id", id.c_str()), PMLOGKS("url", url.c_str()));
            notifyBegin(url, task->bytesTotal());
            notifyDone(url, finished.m_path);
            break;
        }

        case DownloadTask::STATE_STOPPED:
            // a fresh transfer is started with the other idle records
            LOG_DEBUG("%s: task %s was stopped, restarting", __FUNCTION__, id.c_str());
            break;

        default:
            LOG_WARNING_PAIRS(LOGID_DOWNLOAD_FAIL, 2, PMLOGKS("id", id.c_str()), PMLOGKS("state", DownloadTask::stateName(state)), "failed while not running");
            r_handledIds.insert(id);
            notifyError(url, "transfer failed in the background");
            m_retry.add(id);
            break;
        }
    }
}

void DownloadQueue::startMissingTransfers(const std::set<std::string>& handledIds)
{
    std::vector<std::string> ids;
    for (RecordList::iterator it = m_records.begin(); it != m_records.end(); ++it)
        ids.push_back(it->m_id);

    for (std::vector<std::string>::iterator it = ids.begin(); it != ids.end(); ++it) {
        QueueRecord* record = findById(*it);
        if (!record || !record->isActive())
            continue;
        if (m_tasks.find(*it) != m_tasks.end() || handledIds.find(*it) != handledIds.end())
            continue;

        if (record->m_finished) {
            if (m_fileStore->exists(record->m_path))
                continue;

            // finished once, but the file is gone: download again
            QueueRecord reset = *record;
            reset.m_finished = false;
            (void) persist(reset);
            *record = reset;
        }

        startTransfer(*it);
    }
}

void DownloadQueue::deleteOrphanFiles(const std::vector<std::string>& filenames)
{
    std::set<std::string> knownIds;
    for (RecordList::iterator it = m_records.begin(); it != m_records.end(); ++it)
        knownIds.insert(it->m_id);

    for (std::vector<std::string>::const_iterator it = filenames.begin(); it != filenames.end(); ++it) {
        if (knownIds.find(filenameStem(*it)) != knownIds.end())
            continue;

        std::string path = joinPath(m_domainDirectory, *it);
        if (m_fileStore->unlink(path))
            LOG_INFO_PAIRS_ONLY(LOGID_ORPHAN_FILE_DELETE, 1, PMLOGKS("path", path.c_str()));
        else
            LOG_WARNING_PAIRS(LOGID_FILE_DELETE_FAIL, 1, PMLOGKS("path", path.c_str()), "orphan file left in place");
    }
}

void DownloadQueue::scheduleDeadlines()
{
    std::vector<int64_t> deadlines;
    for (RecordList::iterator it = m_records.begin(); it != m_records.end(); ++it) {
        if (it->m_deletionState == QueueRecord::DELETION_AT)
            deadlines.push_back(it->m_deleteAt);
    }
    m_deletion.schedule(deadlines);
}

QueueStatus DownloadQueue::startNetworkMonitoring()
{
    NetworkMonitor* monitor = m_options.networkMonitor;
    if (!monitor)
        return QueueStatus_OK;

    NetworkState state;
    if (!monitor->fetchCurrentState(state)) {
        LOG_WARNING_PAIRS(LOGID_NETWORK_FETCH_FAIL, 1, PMLOGKS("call", "init"), "");
        return QueueStatus_NETWORKERROR;
    }
    m_arbiter.onNetworkState(state);

    std::weak_ptr<int> session = m_session;
    m_networkSubscription = monitor->subscribe(std::bind(&DownloadQueue::onNetworkState, this, session, _1));
    return QueueStatus_OK;
}

void DownloadQueue::rollbackInit()
{
    m_session.reset();
    stopAllTasks();

    if (m_networkSubscription && m_options.networkMonitor)
        m_options.networkMonitor->unsubscribe(m_networkSubscription);
    m_networkSubscription = 0;

    m_retry.clear();
    m_deletion.cancelAll();
    m_records.clear();
    m_initialized = false;
}
