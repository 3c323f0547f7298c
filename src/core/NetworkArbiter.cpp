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

#include <core/NetworkArbiter.h>
#include <util/Logging.h>

#include <algorithm>

NetworkArbiter::NetworkArbiter(ApplyHandler handler)
    : m_handler(handler),
      m_pausedByUser(false),
      m_wouldAutoPause(false)
{
}

void NetworkArbiter::reset(bool pausedByUser, const std::vector<std::string>& allowedTypes)
{
    m_allowedTypes = allowedTypes;
    m_lastState = NetworkState();
    m_pausedByUser = pausedByUser;
    m_wouldAutoPause = false;
}

void NetworkArbiter::setAllowedTypes(const std::vector<std::string>& allowedTypes)
{
    m_allowedTypes = allowedTypes;
}

bool NetworkArbiter::computeAutoPause(const NetworkState& state) const
{
    if (!state.connected)
        return true;
    if (m_allowedTypes.empty())
        return false;
    return std::find(m_allowedTypes.begin(), m_allowedTypes.end(), state.type) == m_allowedTypes.end();
}

void NetworkArbiter::onNetworkState(const NetworkState& state)
{
    bool wasPaused = isPaused();

    m_lastState = state;

    bool wouldAutoPause = computeAutoPause(state);
    if (wouldAutoPause == m_wouldAutoPause)
        return;

    m_wouldAutoPause = wouldAutoPause;
    LOG_INFO_PAIRS(LOGID_NETWORK_STATE_CHANGE, 4,
            PMLOGKS("type", state.type.c_str()),
            PMLOGKFV("connected", "%d", state.connected),
            PMLOGKFV("autoPause", "%d", m_wouldAutoPause),
            PMLOGKFV("userPaused", "%d", m_pausedByUser), "");

    applyIfChanged(wasPaused);
}

void NetworkArbiter::pauseByUser()
{
    bool wasPaused = isPaused();
    m_pausedByUser = true;
    applyIfChanged(wasPaused);
}

void NetworkArbiter::resumeByUser()
{
    bool wasPaused = isPaused();
    m_pausedByUser = false;
    applyIfChanged(wasPaused);
}

void NetworkArbiter::applyIfChanged(bool wasPaused)
{
    bool paused = isPaused();
    if (paused == wasPaused)
        return;
    if (m_handler)
        m_handler(paused);
}
