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

#ifndef CORE_RETRYENGINE_H_
#define CORE_RETRYENGINE_H_

#include <set>
#include <string>
#include <functional>
#include <stdint.h>

#include <base/TimerScheduler.h>

// Ids whose transfer failed, retried together on one shared timer.
//
// The timer only runs while the set is non-empty and the engine is not
// suspended. Each firing hands every queued id to the retry handler and
// empties the set; a retry that fails again comes back through add().
class RetryEngine {
public:
    typedef std::function<void(const std::string& id)> RetryHandler;

    static const int64_t DEFAULT_INTERVAL_MS = 60000;

    RetryEngine(TimerScheduler* scheduler, RetryHandler handler, int64_t intervalMs = DEFAULT_INTERVAL_MS);
    ~RetryEngine();

    void add(const std::string& id);
    void remove(const std::string& id);
    bool contains(const std::string& id) const;

    size_t size() const
    {
        return m_ids.size();
    }

    // stop retrying (queued ids are kept)
    void suspend();
    // re-arm the timer if anything is queued
    void unsuspend();

    bool isSuspended() const
    {
        return m_suspended;
    }

    bool isTimerArmed() const
    {
        return m_timerId != 0;
    }

    void clear();

    void setInterval(int64_t intervalMs);

private:
    void armTimer();
    void disarmTimer();
    void onTimer();

    TimerScheduler* m_scheduler;
    RetryHandler m_handler;
    int64_t m_intervalMs;
    std::set<std::string> m_ids;
    TimerScheduler::TimerId m_timerId;
    bool m_suspended;
};

#endif /* CORE_RETRYENGINE_H_ */
