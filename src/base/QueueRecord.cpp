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

#include <base/QueueRecord.h>
#include <util/DownloadUtils.h>
#include <util/JUtil.h>
#include <util/Logging.h>
#include <util/UrlRep.h>

#include <glib.h>

static const char* s_deletionActive = "active";
static const char* s_deletionNextInit = "nextInit";
static const char* s_deletionAt = "at";

bool QueueRecord::isDueForPurge(int64_t now) const
{
    if (m_deletionState == DELETION_ON_NEXT_INIT)
        return true;
    if (m_deletionState == DELETION_AT)
        return m_deleteAt <= now;
    return false;
}

void QueueRecord::markActive(int64_t now)
{
    m_deletionState = DELETION_NONE;
    m_deleteAt = 0;
    m_createTime = now;
}

void QueueRecord::markForDeletion(int64_t deleteTime)
{
    if (deleteTime > 0) {
        m_deletionState = DELETION_AT;
        m_deleteAt = deleteTime;
    } else {
        m_deletionState = DELETION_ON_NEXT_INIT;
        m_deleteAt = 0;
    }
}

pbnjson::JValue QueueRecord::toJSON() const
{
    pbnjson::JValue jobj = pbnjson::Object();
    jobj.put("id", m_id);
    jobj.put("url", m_url);
    jobj.put("path", m_path);
    jobj.put("createTime", (int64_t) m_createTime);

    switch (m_deletionState) {
    case DELETION_ON_NEXT_INIT:
        jobj.put("deletion", std::string(s_deletionNextInit));
        break;
    case DELETION_AT:
        jobj.put("deletion", std::string(s_deletionAt));
        break;
    default:
        jobj.put("deletion", std::string(s_deletionActive));
        break;
    }
    jobj.put("deleteAt", (int64_t) m_deleteAt);
    jobj.put("finished", m_finished);

    return jobj;
}

std::string QueueRecord::toJSONString() const
{
    return JUtil::toSimpleString(toJSON());
}

//static
bool QueueRecord::fromJSON(const pbnjson::JValue& json, QueueRecord& r_record)
{
    if (!json.isObject())
        return false;

    QueueRecord record;
    record.m_id = JUtil::getString(json, "id");
    record.m_url = JUtil::getString(json, "url");
    record.m_path = JUtil::getString(json, "path");
    if (record.m_id.empty() || record.m_url.empty() || record.m_path.empty())
        return false;

    record.m_createTime = JUtil::getInt64(json, "createTime");
    record.m_finished = JUtil::getBool(json, "finished");

    if (json.hasKey("deletion")) {
        std::string deletion = JUtil::getString(json, "deletion");
        if (deletion == s_deletionActive) {
            record.m_deletionState = DELETION_NONE;
        } else if (deletion == s_deletionNextInit) {
            record.m_deletionState = DELETION_ON_NEXT_INIT;
        } else if (deletion == s_deletionAt) {
            record.m_deletionState = DELETION_AT;
            record.m_deleteAt = JUtil::getInt64(json, "deleteAt");
        } else {
            return false;
        }
    } else {
        // older rows carry the deletion state in the sign of createTime
        if (record.m_createTime > 0) {
            record.m_deletionState = DELETION_NONE;
        } else if (record.m_createTime == 0) {
            record.m_deletionState = DELETION_ON_NEXT_INIT;
        } else {
            record.m_deletionState = DELETION_AT;
            record.m_deleteAt = -record.m_createTime;
            record.m_createTime = 0;
        }
    }

    r_record = record;
    return true;
}

//static
bool QueueRecord::fromJSONString(const std::string& jsonString, QueueRecord& r_record)
{
    std::string reason;
    pbnjson::JValue json = JUtil::parse(jsonString.c_str(), &reason);
    if (json.isNull()) {
        LOG_WARNING_PAIRS(LOGID_RECORD_PARSE_FAIL, 1, PMLOGKS("reason", reason.c_str()), "unparseable record");
        return false;
    }
    return fromJSON(json, r_record);
}

//static
std::string QueueRecord::storageKey(const std::string& domain, const std::string& id)
{
    return domain + "/" + id;
}

//static
std::string QueueRecord::destinationPath(const std::string& basePath, const std::string& domain, const std::string& id, const std::string& url, bool keepExtension)
{
    std::string filename = id;
    if (keepExtension) {
        std::string extension = UrlRep::fromUrl(url).resourceExtension();
        if (!extension.empty())
            filename += "." + extension;
    }
    return joinPath(joinPath(basePath, domain), filename);
}

//static
std::string QueueRecord::generateId()
{
    gchar* uuid = g_uuid_string_random();
    std::string id(uuid);
    g_free(uuid);
    return id;
}
