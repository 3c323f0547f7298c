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

#ifndef CORE_NETWORKARBITER_H_
#define CORE_NETWORKARBITER_H_

#include <string>
#include <vector>
#include <functional>

#include <base/NetworkMonitor.h>

// Combines the user's explicit pause with the pause implied by connectivity.
// The apply handler is called only when the effective paused state flips.
class NetworkArbiter {
public:
    typedef std::function<void(bool paused)> ApplyHandler;

    explicit NetworkArbiter(ApplyHandler handler);

    // back to a known state without notifying
    void reset(bool pausedByUser, const std::vector<std::string>& allowedTypes);

    void setAllowedTypes(const std::vector<std::string>& allowedTypes);
    const std::vector<std::string>& allowedTypes() const
    {
        return m_allowedTypes;
    }

    void onNetworkState(const NetworkState& state);

    void pauseByUser();
    void resumeByUser();

    bool isPaused() const
    {
        return m_pausedByUser || m_wouldAutoPause;
    }

    bool isPausedByUser() const
    {
        return m_pausedByUser;
    }

    bool wouldAutoPause() const
    {
        return m_wouldAutoPause;
    }

    const NetworkState& lastState() const
    {
        return m_lastState;
    }

private:
    bool computeAutoPause(const NetworkState& state) const;
    void applyIfChanged(bool wasPaused);

    ApplyHandler m_handler;
    std::vector<std::string> m_allowedTypes;
    NetworkState m_lastState;
    bool m_pausedByUser;
    bool m_wouldAutoPause;
};

#endif /* CORE_NETWORKARBITER_H_ */
