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

#include <core/DeletionScheduler.h>
#include <util/Logging.h>

const int64_t DeletionScheduler::GRANULARITY_MS;

DeletionScheduler::DeletionScheduler(TimerScheduler* scheduler, WakeHandler handler)
    : m_scheduler(scheduler),
      m_handler(handler)
{
}

DeletionScheduler::~DeletionScheduler()
{
    cancelAll();
}

//static
int64_t DeletionScheduler::roundUpToBoundary(int64_t deadline)
{
    if (deadline <= 0)
        return 0;
    int64_t remainder = deadline % GRANULARITY_MS;
    if (remainder == 0)
        return deadline;
    return deadline - remainder + GRANULARITY_MS;
}

void DeletionScheduler::schedule(const std::vector<int64_t>& deadlines)
{
    if (!m_scheduler)
        return;

    int64_t now = m_scheduler->now();
    for (std::vector<int64_t>::const_iterator it = deadlines.begin(); it != deadlines.end(); ++it) {
        int64_t boundary = roundUpToBoundary(*it);
        if (boundary <= 0 || isArmed(boundary))
            continue;

        int64_t delay = boundary - now;
        if (delay < 0)
            delay = 0;

        m_timers[boundary] = m_scheduler->schedule(delay, std::bind(&DeletionScheduler::onTimer, this, boundary));
        LOG_DEBUG("%s: deletion wake-up armed at %lld", __FUNCTION__, (long long) boundary);
    }
}

void DeletionScheduler::schedule(int64_t deadline)
{
    schedule(std::vector<int64_t>(1, deadline));
}

void DeletionScheduler::cancelAll()
{
    if (m_scheduler) {
        for (std::map<int64_t, TimerScheduler::TimerId>::iterator it = m_timers.begin(); it != m_timers.end(); ++it)
            m_scheduler->cancel(it->second);
    }
    m_timers.clear();
}

void DeletionScheduler::onTimer(int64_t boundary)
{
    m_timers.erase(boundary);
    if (m_handler)
        m_handler();
}
