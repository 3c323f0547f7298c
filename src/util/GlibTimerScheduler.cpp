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

#include <util/GlibTimerScheduler.h>

GlibTimerScheduler::GlibTimerScheduler(GMainContext* context)
    : m_context(context),
      m_nextId(1)
{
    if (m_context)
        g_main_context_ref(m_context);
}

GlibTimerScheduler::~GlibTimerScheduler()
{
    while (!m_sources.empty())
        cancel(m_sources.begin()->first);

    if (m_context)
        g_main_context_unref(m_context);
}

int64_t GlibTimerScheduler::now()
{
    return g_get_real_time() / 1000;
}

TimerScheduler::TimerId GlibTimerScheduler::schedule(int64_t delayMs, Callback callback)
{
    if (delayMs < 0)
        delayMs = 0;
    if (delayMs > G_MAXUINT)
        delayMs = G_MAXUINT;

    TimerData* data = new TimerData;
    data->scheduler = this;
    data->id = m_nextId++;
    data->callback = callback;

    GSource* source = g_timeout_source_new((guint) delayMs);
    g_source_set_callback(source, cbTimeout, data, cbDestroy);
    g_source_attach(source, m_context);
    m_sources[data->id] = source;

    return data->id;
}

void GlibTimerScheduler::cancel(TimerId timerId)
{
    std::map<TimerId, GSource*>::iterator it = m_sources.find(timerId);
    if (it == m_sources.end())
        return;

    GSource* source = it->second;
    m_sources.erase(it);
    g_source_destroy(source);
    g_source_unref(source);
}

//static
gboolean GlibTimerScheduler::cbTimeout(gpointer data)
{
    TimerData* timer = static_cast<TimerData*>(data);
    GlibTimerScheduler* self = timer->scheduler;

    // one-shot: forget the source before running, the callback may re-schedule
    std::map<TimerId, GSource*>::iterator it = self->m_sources.find(timer->id);
    if (it != self->m_sources.end()) {
        g_source_unref(it->second);
        self->m_sources.erase(it);
    }

    Callback callback = timer->callback;
    if (callback)
        callback();

    return G_SOURCE_REMOVE;
}

//static
void GlibTimerScheduler::cbDestroy(gpointer data)
{
    delete static_cast<TimerData*>(data);
}
