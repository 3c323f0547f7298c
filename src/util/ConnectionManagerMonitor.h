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

#ifndef UTIL_CONNECTIONMANAGERMONITOR_H_
#define UTIL_CONNECTIONMANAGERMONITOR_H_

#include <map>
#include <string>
#include <pbnjson.hpp>
#include <luna-service2/lunaservice.h>

#include <base/NetworkMonitor.h>

//! NetworkMonitor fed by com.webos.service.connectionmanager/getstatus
class ConnectionManagerMonitor: public NetworkMonitor {
public:
    explicit ConnectionManagerMonitor(LSHandle* serviceHandle);
    virtual ~ConnectionManagerMonitor();

    //! Subscribe to connection status. false if the call could not be made.
    bool start();
    void stop();

    bool isStarted() const
    {
        return m_token != LSMESSAGE_TOKEN_INVALID;
    }

    virtual bool fetchCurrentState(NetworkState& r_state);
    virtual unsigned long subscribe(Listener listener);
    virtual void unsubscribe(unsigned long subscriptionId);

    //! Apply one getstatus reply; listeners hear about changes only
    void handleStatus(const pbnjson::JValue& root);

    //! Reduce a getstatus reply to one state. false for replies to ignore.
    static bool parseConnectionStatus(const pbnjson::JValue& root, NetworkState& r_state);

private:
    static bool cbConnectionStatus(LSHandle* lshandle, LSMessage* message, void* user_data);

    LSHandle* m_serviceHandle;
    LSMessageToken m_token;
    NetworkState m_state;
    std::map<unsigned long, Listener> m_listeners;
    unsigned long m_nextListenerId;
};

#endif /* UTIL_CONNECTIONMANAGERMONITOR_H_ */
