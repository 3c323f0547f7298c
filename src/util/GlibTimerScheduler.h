// Copyright (c) 2013-2024 LG Electronics, Inc.
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

#ifndef UTIL_GLIBTIMERSCHEDULER_H_
#define UTIL_GLIBTIMERSCHEDULER_H_

#include <map>
#include <glib.h>
#include <base/TimerScheduler.h>

//! TimerScheduler on a glib main context (the default one unless given)
class GlibTimerScheduler: public TimerScheduler {
public:
    explicit GlibTimerScheduler(GMainContext* context = NULL);
    virtual ~GlibTimerScheduler();

    virtual int64_t now();
    virtual TimerId schedule(int64_t delayMs, Callback callback);
    virtual void cancel(TimerId timerId);

    size_t pendingCount() const
    {
        return m_sources.size();
    }

private:
    struct TimerData {
        GlibTimerScheduler* scheduler;
        TimerId id;
        Callback callback;
    };

    static gboolean cbTimeout(gpointer data);
    static void cbDestroy(gpointer data);

    GMainContext* m_context;
    TimerId m_nextId;
    std::map<TimerId, GSource*> m_sources;
};

#endif /* UTIL_GLIBTIMERSCHEDULER_H_ */
