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

#ifndef CORE_DELETIONSCHEDULER_H_
#define CORE_DELETIONSCHEDULER_H_

#include <map>
#include <vector>
#include <functional>
#include <stddef.h>
#include <stdint.h>

#include <base/TimerScheduler.h>

// Wake-ups for deferred deletions. Deadlines are rounded up to the next whole
// minute and share one timer per minute boundary. The wake handler is expected
// to rescan for everything that is due, not only what that boundary covered.
class DeletionScheduler {
public:
    typedef std::function<void()> WakeHandler;

    static const int64_t GRANULARITY_MS = 60000;

    DeletionScheduler(TimerScheduler* scheduler, WakeHandler handler);
    ~DeletionScheduler();

    void schedule(const std::vector<int64_t>& deadlines);
    void schedule(int64_t deadline);

    void cancelAll();

    size_t armedCount() const
    {
        return m_timers.size();
    }

    bool isArmed(int64_t boundary) const
    {
        return m_timers.find(boundary) != m_timers.end();
    }

    static int64_t roundUpToBoundary(int64_t deadline);

private:
    void onTimer(int64_t boundary);

    TimerScheduler* m_scheduler;
    WakeHandler m_handler;
    std::map<int64_t, TimerScheduler::TimerId> m_timers;      // boundary -> timer
};

#endif /* CORE_DELETIONSCHEDULER_H_ */
