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

#ifndef TESTS_SUPPORT_QUEUETESTFIXTURE_H_
#define TESTS_SUPPORT_QUEUETESTFIXTURE_H_

#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include <core/DownloadQueue.h>

#include "FakeDownloadProvider.h"
#include "FakeFileStore.h"
#include "FakeNetworkMonitor.h"
#include "ManualTimerScheduler.h"
#include "MemoryRecordStore.h"

static const char* const s_testDomain = "test";
static const char* const s_testBasePath = "/data/dq";
static const char* const s_testDomainDir = "/data/dq/test";

// Queue wired to in-memory doubles, recording every notification
class QueueTestFixture: public ::testing::Test {
protected:
    QueueTestFixture()
        : m_queue(&m_provider, &m_files, &m_store, &m_timers)
    {
    }

    QueueOptions options()
    {
        QueueOptions opts;
        opts.domain = s_testDomain;
        opts.basePath = s_testBasePath;
        opts.retryIntervalMs = 60000;

        opts.handlers.onBegin = [this](const std::string& url, uint64_t total) {
            m_begins.push_back(std::make_pair(url, total));
        };
        opts.handlers.onProgress = [this](const std::string& url, double, uint64_t, uint64_t) {
            m_progress.push_back(url);
        };
        opts.handlers.onDone = [this](const std::string& url, const std::string& path) {
            m_dones.push_back(std::make_pair(url, path));
        };
        opts.handlers.onWillRemove = [this](const std::string& url) {
            m_willRemove.push_back(url);
        };
        opts.handlers.onError = [this](const std::string& url, const std::string& error) {
            m_errors.push_back(std::make_pair(url, error));
        };
        return opts;
    }

    QueueOptions networkOptions(const std::vector<std::string>& types)
    {
        QueueOptions opts = options();
        opts.networkMonitor = &m_network;
        opts.activeNetworkTypes = types;
        return opts;
    }

    void seed(const QueueRecord& record)
    {
        m_store.put(QueueRecord::storageKey(s_testDomain, record.m_id), record.toJSONString());
    }

    QueueRecord seedActive(const std::string& id, const std::string& url, bool finished = false)
    {
        QueueRecord record(id, url, std::string(s_testDomainDir) + "/" + id + ".mp3", m_timers.now() - 1000);
        record.m_finished = finished;
        seed(record);
        return record;
    }

    bool stored(const std::string& id, QueueRecord& r_record)
    {
        std::string key = QueueRecord::storageKey(s_testDomain, id);
        if (!m_store.has(key))
            return false;
        return QueueRecord::fromJSONString(m_store.get(key), r_record);
    }

    // persisted record for url, searching the whole store
    bool storedByUrl(const std::string& url, QueueRecord& r_record)
    {
        for (std::vector<RecordStore::Entry>::iterator it = m_store.m_entries.begin(); it != m_store.m_entries.end(); ++it) {
            QueueRecord record;
            if (QueueRecord::fromJSONString(it->second, record) && record.m_url == url) {
                r_record = record;
                return true;
            }
        }
        return false;
    }

    FakeDownloadProvider m_provider;
    FakeFileStore m_files;
    MemoryRecordStore m_store;
    ManualTimerScheduler m_timers;
    FakeNetworkMonitor m_network;

    std::vector<std::pair<std::string, uint64_t> > m_begins;
    std::vector<std::string> m_progress;
    std::vector<std::pair<std::string, std::string> > m_dones;
    std::vector<std::string> m_willRemove;
    std::vector<std::pair<std::string, std::string> > m_errors;

    DownloadQueue m_queue;
};

#endif /* TESTS_SUPPORT_QUEUETESTFIXTURE_H_ */
