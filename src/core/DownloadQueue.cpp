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

DownloadQueue::DownloadQueue(DownloadProvider* provider, FileStore* fileStore, RecordStore* recordStore, TimerScheduler* timers)
    : m_provider(provider),
      m_fileStore(fileStore),
      m_recordStore(recordStore),
      m_timers(timers),
      m_initialized(false),
      m_taskSerial(0),
      m_retry(timers, std::bind(&DownloadQueue::onRetry, this, _1)),
      m_deletion(timers, std::bind(&DownloadQueue::onDeletionWake, this)),
      m_arbiter(std::bind(&DownloadQueue::applyPause, this, _1)),
      m_networkSubscription(0)
{
}

DownloadQueue::~DownloadQueue()
{
    terminate();
}

void DownloadQueue::terminate()
{
    if (!m_initialized)
        return;

    // late callbacks from this session check m_session and bail out
    m_session.reset();
    m_initialized = false;

    stopAllTasks();

    if (m_networkSubscription && m_options.networkMonitor)
        m_options.networkMonitor->unsubscribe(m_networkSubscription);
    m_networkSubscription = 0;

    m_retry.clear();
    m_deletion.cancelAll();
    m_records.clear();

    LOG_INFO_PAIRS_ONLY(LOGID_QUEUE_TERMINATE, 1, PMLOGKS("domain", m_options.domain.c_str()));
}

QueueStatus DownloadQueue::addUrl(const std::string& url)
{
    if (!m_initialized) {
        LOG_WARNING_PAIRS(LOGID_QUEUE_NOT_INITIALIZED, 1, PMLOGKS("call", "addUrl"), "");
        return QueueStatus_NOTINITIALIZED;
    }

    QueueRecord* existing = findByUrl(url);
    if (existing && existing->isActive())
        return QueueStatus_OK;

    if (existing) {
        // revive a record that was waiting for deferred deletion
        QueueRecord revived = *existing;
        revived.markActive(m_timers->now());
        bool complete = revived.m_finished && m_fileStore->exists(revived.m_path);
        if (!complete)
            revived.m_finished = false;

        if (!persist(revived))
            return QueueStatus_STOREERROR;
        *existing = revived;

        if (complete) {
            uint64_t size = 0;
            if (!m_fileStore->stat(revived.m_path, size))
                size = 0;
            notifyBegin(revived.m_url, size);
            notifyDone(revived.m_url, revived.m_path);
        } else {
            startTransfer(revived.m_id);
        }
        return QueueStatus_OK;
    }

    std::string id = QueueRecord::generateId();
    QueueRecord record(id, url, QueueRecord::destinationPath(m_options.basePath, m_options.domain, id, url, m_options.keepExtension), m_timers->now());

    // record first so a crash can never leave a file nobody owns
    if (!persist(record))
        return QueueStatus_STOREERROR;

    m_records.push_back(record);
    startTransfer(id);

    return QueueStatus_OK;
}

QueueStatus DownloadQueue::removeUrl(const std::string& url, int64_t deleteTime)
{
    if (!m_initialized) {
        LOG_WARNING_PAIRS(LOGID_QUEUE_NOT_INITIALIZED, 1, PMLOGKS("call", "removeUrl"), "");
        return QueueStatus_NOTINITIALIZED;
    }

    QueueRecord* record = findByUrl(url);
    if (!record)
        return QueueStatus_OK;

    std::string id = record->m_id;
    stopTask(id);
    m_retry.remove(id);
    notifyWillRemove(url);

    // the handler may have changed things under us
    record = findById(id);
    if (!record)
        return QueueStatus_OK;

    if (deleteTime < 0) {
        if (!m_recordStore->remove(storageKey(id))) {
            LOG_WARNING_PAIRS(LOGID_RECORD_PERSIST_FAIL, 2, PMLOGKS("id", id.c_str()), PMLOGKS("op", "remove"), "");
            restartKeptRecord(id);
            return QueueStatus_STOREERROR;
        }
        std::string path = record->m_path;
        eraseRecord(id);
        (void) m_fileStore->unlink(path);
        LOG_INFO_PAIRS_ONLY(LOGID_RECORD_REMOVE, 2, PMLOGKS("id", id.c_str()), PMLOGKS("url", url.c_str()));
        return QueueStatus_OK;
    }

    QueueRecord marked = *record;
    marked.markForDeletion(deleteTime);
    if (!persist(marked)) {
        restartKeptRecord(id);
        return QueueStatus_STOREERROR;
    }
    *record = marked;

    if (deleteTime > 0)
        m_deletion.schedule(deleteTime);

    LOG_INFO_PAIRS_ONLY(LOGID_RECORD_LAZY_REMOVE, 3, PMLOGKS("id", id.c_str()), PMLOGKS("url", url.c_str()), PMLOGKFV("deleteTime", "%lld", (long long) deleteTime));
    return QueueStatus_OK;
}

QueueStatus DownloadQueue::setQueue(const std::vector<std::string>& urls, int64_t deleteTime)
{
    if (!m_initialized) {
        LOG_WARNING_PAIRS(LOGID_QUEUE_NOT_INITIALIZED, 1, PMLOGKS("call", "setQueue"), "");
        return QueueStatus_NOTINITIALIZED;
    }

    std::set<std::string> wanted(urls.begin(), urls.end());

    std::vector<std::string> removeIds;
    for (RecordList::iterator it = m_records.begin(); it != m_records.end(); ++it) {
        if (it->isActive() && wanted.find(it->m_url) == wanted.end())
            removeIds.push_back(it->m_id);
    }

    for (std::vector<std::string>::iterator it = removeIds.begin(); it != removeIds.end(); ++it) {
        QueueRecord* record = findById(*it);
        if (!record)
            continue;
        std::string url = record->m_url;
        stopTask(*it);
        m_retry.remove(*it);
        notifyWillRemove(url);
    }

    // drop whatever the handlers already dealt with
    std::vector<QueueRecord*> removals;
    for (std::vector<std::string>::iterator it = removeIds.begin(); it != removeIds.end(); ++it) {
        QueueRecord* record = findById(*it);
        if (record && record->isActive())
            removals.push_back(record);
    }

    QueueStatus result = QueueStatus_OK;
    if (!removals.empty()) {
        bool stored = true;
        if (deleteTime < 0) {
            std::vector<std::string> keys;
            for (std::vector<QueueRecord*>::iterator it = removals.begin(); it != removals.end(); ++it)
                keys.push_back(storageKey((*it)->m_id));

            stored = m_recordStore->removeMulti(keys);
            if (!stored)
                LOG_WARNING_PAIRS(LOGID_RECORD_PERSIST_FAIL, 2, PMLOGKFV("count", "%zu", keys.size()), PMLOGKS("op", "removeMulti"), "");
        } else {
            std::vector<RecordStore::Entry> entries;
            for (std::vector<QueueRecord*>::iterator it = removals.begin(); it != removals.end(); ++it) {
                QueueRecord marked = **it;
                marked.markForDeletion(deleteTime);
                entries.push_back(RecordStore::Entry(storageKey(marked.m_id), marked.toJSONString()));
            }

            stored = m_recordStore->writeMulti(entries);
            if (!stored)
                LOG_WARNING_PAIRS(LOGID_RECORD_PERSIST_FAIL, 2, PMLOGKFV("count", "%zu", entries.size()), PMLOGKS("op", "writeMulti"), "");
        }

        if (!stored) {
            // the records stay queued, so their transfers come back
            std::vector<std::string> ids;
            for (std::vector<QueueRecord*>::iterator it = removals.begin(); it != removals.end(); ++it)
                ids.push_back((*it)->m_id);
            for (std::vector<std::string>::iterator it = ids.begin(); it != ids.end(); ++it)
                restartKeptRecord(*it);
            result = QueueStatus_STOREERROR;
        } else if (deleteTime < 0) {
            std::vector<std::string> ids;
            std::vector<std::string> paths;
            for (std::vector<QueueRecord*>::iterator it = removals.begin(); it != removals.end(); ++it) {
                ids.push_back((*it)->m_id);
                paths.push_back((*it)->m_path);
            }
            for (std::vector<std::string>::iterator it = ids.begin(); it != ids.end(); ++it)
                eraseRecord(*it);
            for (std::vector<std::string>::iterator it = paths.begin(); it != paths.end(); ++it)
                (void) m_fileStore->unlink(*it);
            LOG_INFO_PAIRS_ONLY(LOGID_RECORD_REMOVE, 2, PMLOGKFV("count", "%zu", ids.size()), PMLOGKFV("deleteTime", "%lld", (long long) deleteTime));
        } else {
            for (std::vector<QueueRecord*>::iterator it = removals.begin(); it != removals.end(); ++it)
                (*it)->markForDeletion(deleteTime);

            if (deleteTime > 0)
                m_deletion.schedule(deleteTime);

            LOG_INFO_PAIRS_ONLY(LOGID_RECORD_LAZY_REMOVE, 2, PMLOGKFV("count", "%zu", removals.size()), PMLOGKFV("deleteTime", "%lld", (long long) deleteTime));
        }
    }

    std::set<std::string> seen;
    for (std::vector<std::string>::const_iterator it = urls.begin(); it != urls.end(); ++it) {
        if (!seen.insert(*it).second)
            continue;

        QueueRecord* record = findByUrl(*it);
        if (record && record->isActive())
            continue;

        QueueStatus status = addUrl(*it);
        if (status != QueueStatus_OK && result == QueueStatus_OK)
            result = status;
    }

    return result;
}

bool DownloadQueue::getStatus(const std::string& url, QueueItemStatus& r_status)
{
    if (!m_initialized)
        return false;

    QueueRecord* record = findByUrl(url);
    if (!record || !record->isActive())
        return false;

    r_status.url = record->m_url;
    r_status.path = record->m_path;
    r_status.complete = record->m_finished && m_fileStore->exists(record->m_path);
    return true;
}

QueueStatus DownloadQueue::getQueueStatus(std::vector<QueueItemStatus>& r_statuses)
{
    if (!m_initialized)
        return QueueStatus_NOTINITIALIZED;

    for (RecordList::iterator it = m_records.begin(); it != m_records.end(); ++it) {
        if (!it->isActive())
            continue;

        QueueItemStatus status;
        status.url = it->m_url;
        status.path = it->m_path;
        status.complete = it->m_finished && m_fileStore->exists(it->m_path);
        r_statuses.push_back(status);
    }
    return QueueStatus_OK;
}

QueueStatus DownloadQueue::getAvailableUrl(const std::string& url, std::string& r_url)
{
    r_url = url;
    if (!m_initialized)
        return QueueStatus_NOTINITIALIZED;

    QueueItemStatus status;
    if (getStatus(url, status) && status.complete)
        r_url = status.path;
    return QueueStatus_OK;
}

QueueStatus DownloadQueue::pauseAll()
{
    if (!m_initialized)
        return QueueStatus_NOTINITIALIZED;

    LOG_INFO_PAIRS_ONLY(LOGID_DOWNLOAD_PAUSE, 2, PMLOGKS("by", "user"), PMLOGKFV("tasks", "%zu", m_tasks.size()));
    m_arbiter.pauseByUser();
    return QueueStatus_OK;
}

QueueStatus DownloadQueue::resumeAll()
{
    if (!m_initialized)
        return QueueStatus_NOTINITIALIZED;

    LOG_INFO_PAIRS_ONLY(LOGID_DOWNLOAD_RESUME, 3, PMLOGKS("by", "user"), PMLOGKFV("tasks", "%zu", m_tasks.size()), PMLOGKFV("autoPause", "%d", m_arbiter.wouldAutoPause()));
    m_arbiter.resumeByUser();
    return QueueStatus_OK;
}

QueueStatus DownloadQueue::setActiveNetworkTypes(const std::vector<std::string>& types)
{
    if (!m_initialized)
        return QueueStatus_NOTINITIALIZED;

    if (!m_options.networkMonitor) {
        LOG_WARNING_PAIRS(LOGID_QUEUE_INVALID_CONFIG, 1, PMLOGKS("call", "setActiveNetworkTypes"), "no network monitor");
        return QueueStatus_INVALIDCONFIG;
    }

    m_options.activeNetworkTypes = types;
    m_arbiter.setAllowedTypes(types);

    NetworkState state;
    if (!m_options.networkMonitor->fetchCurrentState(state)) {
        LOG_WARNING_PAIRS(LOGID_NETWORK_FETCH_FAIL, 1, PMLOGKS("call", "setActiveNetworkTypes"), "");
        return QueueStatus_NETWORKERROR;
    }
    m_arbiter.onNetworkState(state);
    return QueueStatus_OK;
}

QueueRecord* DownloadQueue::findById(const std::string& id)
{
    for (RecordList::iterator it = m_records.begin(); it != m_records.end(); ++it) {
        if (it->m_id == id)
            return &(*it);
    }
    return NULL;
}

QueueRecord* DownloadQueue::findByUrl(const std::string& url)
{
    for (RecordList::iterator it = m_records.begin(); it != m_records.end(); ++it) {
        if (it->m_url == url)
            return &(*it);
    }
    return NULL;
}

bool DownloadQueue::eraseRecord(const std::string& id)
{
    for (RecordList::iterator it = m_records.begin(); it != m_records.end(); ++it) {
        if (it->m_id == id) {
            m_records.erase(it);
            return true;
        }
    }
    return false;
}

bool DownloadQueue::persist(const QueueRecord& record)
{
    if (m_recordStore->write(storageKey(record.m_id), record.toJSONString()))
        return true;

    LOG_WARNING_PAIRS(LOGID_RECORD_PERSIST_FAIL, 2, PMLOGKS("id", record.m_id.c_str()), PMLOGKS("op", "write"), "");
    return false;
}

std::string DownloadQueue::storageKey(const std::string& id) const
{
    return QueueRecord::storageKey(m_options.domain, id);
}

void DownloadQueue::startTransfer(const std::string& id)
{
    QueueRecord* record = findById(id);
    if (!record)
        return;

    std::string url = record->m_url;
    std::shared_ptr<DownloadTask> task = m_provider->startTransfer(id, url, record->m_path);
    if (!task) {
        LOG_WARNING_PAIRS(LOGID_DOWNLOAD_FAIL, 2, PMLOGKS("id", id.c_str()), PMLOGKS("url", url.c_str()), "provider refused transfer");
        notifyError(url, "failed to start transfer");
        if (findById(id))
            m_retry.add(id);
        return;
    }

    LOG_INFO_PAIRS_ONLY(LOGID_DOWNLOAD_START, 2, PMLOGKS("id", id.c_str()), PMLOGKS("url", url.c_str()));
    attachTask(id, task);
    if (m_arbiter.isPaused())
        task->pause();
}

void DownloadQueue::restartKeptRecord(const std::string& id)
{
    QueueRecord* record = findById(id);
    if (!record || !record->isActive() || record->m_finished)
        return;
    if (m_tasks.find(id) != m_tasks.end())
        return;
    startTransfer(id);
}

void DownloadQueue::attachTask(const std::string& id, const std::shared_ptr<DownloadTask>& task)
{
    unsigned long serial = ++m_taskSerial;
    m_tasks[id] = TaskSlot(task, serial);

    std::weak_ptr<int> session = m_session;
    task->begin(std::bind(&DownloadQueue::onTaskBegin, this, session, id, serial, _1))
         .progress(std::bind(&DownloadQueue::onTaskProgress, this, session, id, serial, _1, _2, _3))
         .done(std::bind(&DownloadQueue::onTaskDone, this, session, id, serial))
         .error(std::bind(&DownloadQueue::onTaskError, this, session, id, serial, _1, _2));
}

std::shared_ptr<DownloadTask> DownloadQueue::detachTask(const std::string& id)
{
    std::shared_ptr<DownloadTask> task;
    TaskMap::iterator it = m_tasks.find(id);
    if (it != m_tasks.end()) {
        task = it->second.task;
        m_tasks.erase(it);
    }
    return task;
}

void DownloadQueue::stopTask(const std::string& id)
{
    std::shared_ptr<DownloadTask> task = detachTask(id);
    if (task)
        task->stop();
}

void DownloadQueue::stopAllTasks()
{
    TaskMap tasks;
    tasks.swap(m_tasks);
    for (TaskMap::iterator it = tasks.begin(); it != tasks.end(); ++it) {
        if (it->second.task)
            it->second.task->stop();
    }
}

QueueRecord* DownloadQueue::liveRecord(const std::weak_ptr<int>& session, const std::string& id, unsigned long serial, const char* event)
{
    if (session.expired()) {
        LOG_DEBUG("%s: %s for %s from a terminated session", __FUNCTION__, event, id.c_str());
        return NULL;
    }

    TaskMap::iterator it = m_tasks.find(id);
    if (it == m_tasks.end() || it->second.serial != serial) {
        LOG_DEBUG("%s: %s for detached task %s", __FUNCTION__, event, id.c_str());
        return NULL;
    }

    QueueRecord* record = findById(id);
    if (!record) {
        LOG_WARNING_PAIRS(LOGID_ROGUE_CALLBACK, 2, PMLOGKS("id", id.c_str()), PMLOGKS("event", event), "no record for live task");
        return NULL;
    }
    return record;
}

void DownloadQueue::onTaskBegin(const std::weak_ptr<int>& session, const std::string& id, unsigned long serial, uint64_t totalBytes)
{
    QueueRecord* record = liveRecord(session, id, serial, "begin");
    if (!record)
        return;

    notifyBegin(record->m_url, totalBytes);
}

void DownloadQueue::onTaskProgress(const std::weak_ptr<int>& session, const std::string& id, unsigned long serial, double fraction, uint64_t bytesWritten, uint64_t totalBytes)
{
    QueueRecord* record = liveRecord(session, id, serial, "progress");
    if (!record)
        return;

    if (m_options.handlers.onProgress)
        m_options.handlers.onProgress(record->m_url, fraction, bytesWritten, totalBytes);
}

void DownloadQueue::onTaskDone(const std::weak_ptr<int>& session, const std::string& id, unsigned long serial)
{
    QueueRecord* record = liveRecord(session, id, serial, "done");
    if (!record)
        return;

    // keep the task alive until its own callback has returned
    std::shared_ptr<DownloadTask> task = detachTask(id);
    m_retry.remove(id);

    QueueRecord finished = *record;
    finished.m_finished = true;
    (void) persist(finished);
    *record = finished;

    m_provider->completeTransfer(id);

    LOG_INFO_PAIRS_ONLY(LOGID_DOWNLOAD_COMPLETE, 2, PMLOGKS("id", id.c_str()), PMLOGKS("url", finished.m_url.c_str()));
    notifyDone(finished.m_url, finished.m_path);
}

void DownloadQueue::onTaskError(const std::weak_ptr<int>& session, const std::string& id, unsigned long serial, const std::string& message, int code)
{
    QueueRecord* record = liveRecord(session, id, serial, "error");
    if (!record)
        return;

    std::shared_ptr<DownloadTask> task = detachTask(id);
    std::string url = record->m_url;

    LOG_WARNING_PAIRS(LOGID_DOWNLOAD_FAIL, 3, PMLOGKS("id", id.c_str()), PMLOGKFV("code", "%d", code), PMLOGKS("message", message.c_str()), "");
    notifyError(url, message);

    record = findById(id);
    if (record && record->isActive() && !record->m_finished)
        m_retry.add(id);
}

void DownloadQueue::onRetry(const std::string& id)
{
    if (!m_initialized)
        return;

    QueueRecord* record = findById(id);
    if (!record || !record->isActive() || record->m_finished)
        return;
    if (m_tasks.find(id) != m_tasks.end())
        return;

    LOG_INFO_PAIRS_ONLY(LOGID_DOWNLOAD_RETRY, 2, PMLOGKS("id", id.c_str()), PMLOGKS("url", record->m_url.c_str()));
    startTransfer(id);
}

void DownloadQueue::onDeletionWake()
{
    if (!m_initialized)
        return;

    int64_t now = m_timers->now();

    std::vector<std::string> ids;
    std::vector<std::string> keys;
    std::vector<std::string> paths;
    std::vector<int64_t> pending;
    for (RecordList::iterator it = m_records.begin(); it != m_records.end(); ++it) {
        if (it->m_deletionState != QueueRecord::DELETION_AT)
            continue;
        if (it->isDueForPurge(now)) {
            ids.push_back(it->m_id);
            keys.push_back(storageKey(it->m_id));
            paths.push_back(it->m_path);
        } else {
            pending.push_back(it->m_deleteAt);
        }
    }

    // the timer may fire early (capped delay, wall clock set back), so every
    // deadline still ahead keeps a wake-up
    m_deletion.schedule(pending);

    if (ids.empty())
        return;

    if (!m_recordStore->removeMulti(keys)) {
        LOG_WARNING_PAIRS(LOGID_RECORD_PERSIST_FAIL, 2, PMLOGKFV("count", "%zu", keys.size()), PMLOGKS("op", "purge"), "retrying at next boundary");
        m_deletion.schedule(now + DeletionScheduler::GRANULARITY_MS);
        return;
    }

    for (std::vector<std::string>::iterator it = ids.begin(); it != ids.end(); ++it) {
        stopTask(*it);
        m_retry.remove(*it);
        eraseRecord(*it);
    }
    for (std::vector<std::string>::iterator it = paths.begin(); it != paths.end(); ++it)
        (void) m_fileStore->unlink(*it);

    LOG_INFO_PAIRS_ONLY(LOGID_RECORD_PURGE, 1, PMLOGKFV("count", "%zu", ids.size()));
}

void DownloadQueue::onNetworkState(const std::weak_ptr<int>& session, const NetworkState& state)
{
    if (session.expired())
        return;
    m_arbiter.onNetworkState(state);
}

void DownloadQueue::applyPause(bool paused)
{
    // handlers of pause()/resume() may detach tasks, so walk a copy
    std::vector<std::shared_ptr<DownloadTask> > tasks;
    for (TaskMap::iterator it = m_tasks.begin(); it != m_tasks.end(); ++it)
        tasks.push_back(it->second.task);

    if (paused) {
        LOG_INFO_PAIRS_ONLY(LOGID_DOWNLOAD_PAUSE, 2, PMLOGKS("by", m_arbiter.isPausedByUser() ? "user" : "network"), PMLOGKFV("tasks", "%zu", tasks.size()));
        m_retry.suspend();
        for (std::vector<std::shared_ptr<DownloadTask> >::iterator it = tasks.begin(); it != tasks.end(); ++it)
            (*it)->pause();
    } else {
        LOG_INFO_PAIRS_ONLY(LOGID_DOWNLOAD_RESUME, 1, PMLOGKFV("tasks", "%zu", tasks.size()));
        for (std::vector<std::shared_ptr<DownloadTask> >::iterator it = tasks.begin(); it != tasks.end(); ++it)
            (*it)->resume();
        m_retry.unsuspend();
    }
}

void DownloadQueue::notifyBegin(const std::string& url, uint64_t totalBytes)
{
    if (m_options.handlers.onBegin)
        m_options.handlers.onBegin(url, totalBytes);
}

void DownloadQueue::notifyDone(const std::string& url, const std::string& path)
{
    if (m_options.handlers.onDone)
        m_options.handlers.onDone(url, path);
}

void DownloadQueue::notifyWillRemove(const std::string& url)
{
    if (m_options.handlers.onWillRemove)
        m_options.handlers.onWillRemove(url);
}

void DownloadQueue::notifyError(const std::string& url, const std::string& error)
{
    if (m_options.handlers.onError)
        m_options.handlers.onError(url, error);
}
