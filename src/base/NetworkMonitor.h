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

#ifndef BASE_NETWORKMONITOR_H_
#define BASE_NETWORKMONITOR_H_

#include <string>
#include <functional>

struct NetworkState {
    NetworkState()
        : connected(false), type("none")
    {
    }

    NetworkState(bool c, const std::string& t)
        : connected(c), type(t)
    {
    }

    bool connected;
    std::string type;       // "ethernet", "wifi", "cellular", "bluetooth" or "none"
};

class NetworkMonitor {
public:
    typedef std::function<void(const NetworkState&)> Listener;

    virtual ~NetworkMonitor()
    {
    }

    virtual bool fetchCurrentState(NetworkState& r_state) = 0;

    // returns a non-zero subscription id
    virtual unsigned long subscribe(Listener listener) = 0;
    virtual void unsubscribe(unsigned long subscriptionId) = 0;
};

#endif /*BASE_NETWORKMONITOR_H_*/
