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

#include <core/RetryEngine.h>
#include <util/Logging.h>

#include <vector>

const int64_t RetryEngine::DEFAULT_INTERVAL_MS;

RetryEngine::RetryEngine(TimerScheduler* scheduler, RetryHandler handler, int64_t intervalMs)
    : m_scheduler(scheduler),
      m_handler(handler),
      m_intervalMs(intervalMs > 0 ? intervalMs : DEFAULT_INTERVAL_MS),
      m_timerId(0),
      m_suspended(false)
{
}

RetryEngine::~RetryEngine()
{
    disarmTimer();
}

void RetryEngine::add(const std::string& id)
{
    m_ids.insert(id);
    armTimer();
}

void RetryEngine::remove(const std::string& id)
{
    m_ids.erase(id);
    if (m_ids.empty())
        disarmTimer();
}

bool RetryEngine::contains(const std::string& id) const
{
    return m_ids.find(id) != m_ids.end();
}

void RetryEngine::suspend()
{
    m_suspended = true;
    disarmTimer();
}

void RetryEngine::unsuspend()
{
    m_suspended = false;
    armTimer();
}

void RetryEngine::clear()
{
    m_ids.clear();
    disarmTimer();
}

void RetryEngine::setInterval(int64_t intervalMs)
{
    if (intervalMs > 0)
        m_intervalMs = intervalMs;
}

void RetryEngine::armTimer()
{
    if (m_timerId || m_suspended || m_ids.empty() || !m_scheduler)
        return;

    m_timerId = m_scheduler->schedule(m_intervalMs, std::bind(&RetryEngine::onTimer, this));
}

void RetryEngine::disarmTimer()
{
    if (!m_timerId)
        return;

    if (m_scheduler)
        m_scheduler->cancel(m_timerId);
    m_timerId = 0;
}

void RetryEngine::onTimer()
{
    m_timerId = 0;

    // handlers may add ids back, so work from a snapshot
    std::vector<std::string> ids(m_ids.begin(), m_ids.end());
    m_ids.clear();

    LOG_DEBUG("%s: retrying %zu transfer(s)", __FUNCTION__, ids.size());

    for (std::vector<std::string>::iterator it = ids.begin(); it != ids.end(); ++it) {
        if (m_handler)
            m_handler(*it);
    }

    armTimer();
}
