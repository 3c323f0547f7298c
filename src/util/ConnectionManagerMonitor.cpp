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

#include <util/ConnectionManagerMonitor.h>
#include <util/JUtil.h>
#include <util/Logging.h>

#include <glib.h>
#include <vector>

static bool isInterfaceOnInternet(const pbnjson::JValue& topLevelObject)
{
    if (!topLevelObject.isObject() || !topLevelObject.hasKey("state"))
        return false;

    std::string state = JUtil::getString(topLevelObject, "state");
    std::string onInternet = JUtil::getString(topLevelObject, "onInternet", "no");
    return state == "connected" && onInternet == "yes";
}

ConnectionManagerMonitor::ConnectionManagerMonitor(LSHandle* serviceHandle)
    : m_serviceHandle(serviceHandle),
      m_token(LSMESSAGE_TOKEN_INVALID),
      m_nextListenerId(1)
{
}

ConnectionManagerMonitor::~ConnectionManagerMonitor()
{
    stop();
}

bool ConnectionManagerMonitor::start()
{
    if (isStarted())
        return true;
    if (!m_serviceHandle)
        return false;

    LSError lsError;
    LSErrorInit(&lsError);

    if (!LSCall(m_serviceHandle, "luna://com.webos.service.connectionmanager/getstatus", "{\"subscribe\":true}",
            cbConnectionStatus, this, &m_token, &lsError)) {
        LOG_ERROR_PAIRS(LOGID_CNCTNMGR_GETSTUS_ERR, 1, PMLOGKS("ERROR", lsError.message), "");
        LSErrorFree(&lsError);
        m_token = LSMESSAGE_TOKEN_INVALID;
        return false;
    }
    return true;
}

void ConnectionManagerMonitor::stop()
{
    if (!isStarted())
        return;

    LSError lsError;
    LSErrorInit(&lsError);
    if (!LSCallCancel(m_serviceHandle, m_token, &lsError)) {
        LOG_DEBUG("%s: LSCallCancel failed: %s", __FUNCTION__, lsError.message);
        LSErrorFree(&lsError);
    }
    m_token = LSMESSAGE_TOKEN_INVALID;
}

bool ConnectionManagerMonitor::fetchCurrentState(NetworkState& r_state)
{
    if (!isStarted())
        return false;

    // disconnected until the first reply lands
    r_state = m_state;
    return true;
}

unsigned long ConnectionManagerMonitor::subscribe(Listener listener)
{
    unsigned long id = m_nextListenerId++;
    m_listeners[id] = listener;
    return id;
}

void ConnectionManagerMonitor::unsubscribe(unsigned long subscriptionId)
{
    m_listeners.erase(subscriptionId);
}

void ConnectionManagerMonitor::handleStatus(const pbnjson::JValue& root)
{
    NetworkState state;
    if (!parseConnectionStatus(root, state))
        return;

    if (state.connected == m_state.connected && state.type == m_state.type)
        return;

    LOG_DEBUG("CONNECTION-STATUS: %s (%s)", state.connected ? "connected" : "disconnected", state.type.c_str());
    m_state = state;

    // listeners may unsubscribe while we notify
    std::vector<Listener> listeners;
    for (std::map<unsigned long, Listener>::iterator it = m_listeners.begin(); it != m_listeners.end(); ++it)
        listeners.push_back(it->second);
    for (std::vector<Listener>::iterator it = listeners.begin(); it != listeners.end(); ++it) {
        if (*it)
            (*it)(state);
    }
}

//static
bool ConnectionManagerMonitor::parseConnectionStatus(const pbnjson::JValue& root, NetworkState& r_state)
{
    if (!root.isObject())
        return false;

    // network is not allowed..
    if (!JUtil::getBool(root, "returnValue"))
        return false;

    bool wiredUp = root.hasKey("wired") && isInterfaceOnInternet(root["wired"]);
    bool wifiUp = root.hasKey("wifi") && isInterfaceOnInternet(root["wifi"]);

    bool wanUp = false;
    if (root.hasKey("wan")) {
        pbnjson::JValue contextsArray = root["wan"]["connectedContexts"];
        if (contextsArray.isArray()) {
            for (int i = 0; i < contextsArray.arraySize(); i++) {
                pbnjson::JValue contextObject = contextsArray[i];
                if (JUtil::getString(contextObject, "name") == "default"
                        && JUtil::getBool(contextObject, "connected")
                        && JUtil::getBool(contextObject, "onInternet")) {
                    wanUp = true;
                    break;
                }
            }
        }
    }

    bool btpanUp = false;
    if (root.hasKey("btpan")) {
        pbnjson::JValue btpan = root["btpan"];
        btpanUp = JUtil::getString(btpan, "state") == "connected";
    }

    if (wiredUp)
        r_state = NetworkState(true, "ethernet");
    else if (wifiUp)
        r_state = NetworkState(true, "wifi");
    else if (wanUp)
        r_state = NetworkState(true, "cellular");
    else if (btpanUp)
        r_state = NetworkState(true, "bluetooth");
    else
        r_state = NetworkState(false, "none");

    return true;
}

//static
bool ConnectionManagerMonitor::cbConnectionStatus(LSHandle* lshandle, LSMessage* message, void* user_data)
{
    ConnectionManagerMonitor* self = static_cast<ConnectionManagerMonitor*>(user_data);
    if (!self)
        return false;

    const char* str = LSMessageGetPayload(message);
    if (!str)
        return false;

    LOG_DEBUG("Conn Manager - Connection Status payload is %s", str);

    pbnjson::JValue root = JUtil::parse(str);
    if (!root.isObject())
        return true;

    if (!root.hasKey("returnValue")) {
        gchar* escaped_errtext = g_strescape(str, NULL);
        if (escaped_errtext) {
            LOG_ERROR_PAIRS(LOGID_CNCTNMGR_SERSTUS_PARM_MISS, 2, PMLOGKS("ERROR", "called with a message that didn't include returnValue field"), PMLOGKS("MESSAGE", escaped_errtext), "");
            g_free(escaped_errtext);
        }
        return true;
    }

    self->handleStatus(root);
    return true;
}
