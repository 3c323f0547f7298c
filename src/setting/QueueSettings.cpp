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

#include <glib.h>
#include <setting/QueueSettings.h>
#include <util/DownloadUtils.h>
#include <util/Logging.h>

#define KEY_STRING(cat,name,var) \
{\
    gchar* _vs;\
    GError* _error = 0;\
    _vs=g_key_file_get_string(keyfile,cat,name,&_error);\
    if( !_error && _vs ) { var=(const char*)_vs; g_free(_vs); }\
    else g_error_free(_error); \
}

#define KEY_BOOLEAN(cat,name,var) \
{\
    gboolean _vb;\
    GError* _error = 0;\
    _vb=g_key_file_get_boolean(keyfile,cat,name,&_error);\
    if( !_error ) { var=_vb; }\
    else g_error_free(_error); \
}

#define KEY_INTEGER(cat,name,var) \
{\
    int _v = 0;\
    GError* _error = 0;\
    _v=g_key_file_get_integer(keyfile,cat,name,&_error);\
    if( !_error ) { var=_v; }\
    else g_error_free(_error); \
}

#define KEY_STRING_LIST(cat,name,var) \
{\
    gchar** _vl;\
    gsize _len = 0;\
    GError* _error = 0;\
    _vl=g_key_file_get_string_list(keyfile,cat,name,&_len,&_error);\
    if( !_error && _vl ) {\
        var.clear();\
        for (gsize _i = 0; _i < _len; ++_i) {\
            std::string _item = trimWhitespace(_vl[_i]);\
            if (!_item.empty()) var.push_back(_item);\
        }\
        g_strfreev(_vl);\
    }\
    else g_error_free(_error); \
}

static const char* s_defaultDomain = "main";
static const char* s_defaultBasePath = "/media/internal/downloadqueue";
static const char* s_defaultDbPath = "/var/lib/downloadqueue/records.db";
static const int s_defaultRetryIntervalSeconds = 60;

const char* QueueSettings::DEFAULT_SETTINGS_FILE = "/etc/downloadqueue.conf";

//static
bool QueueSettings::validateBasePath(const std::string& path)
{
    //do not allow /../ in the path. This will avoid complicated parsing to check for valid paths
    if (path.find("..") != std::string::npos)
        return false;

    return !path.empty() && path[0] == '/';
}

//static
bool QueueSettings::validateDomain(const std::string& domain)
{
    return !domain.empty() && domain.find('/') == std::string::npos && domain != "." && domain != "..";
}

QueueSettings::QueueSettings()
    : m_domain(s_defaultDomain),
      m_basePath(s_defaultBasePath),
      m_startActive(true),
      m_keepExtension(true),
      m_retryIntervalSeconds(s_defaultRetryIntervalSeconds),
      m_dbPath(s_defaultDbPath)
{
}

QueueSettings::~QueueSettings()
{
}

bool QueueSettings::load(const std::string& path)
{
    GKeyFile* keyfile;
    GKeyFileFlags flags;
    GError* error = 0;

    keyfile = g_key_file_new();
    if (!keyfile)
        return false;
    flags = GKeyFileFlags(G_KEY_FILE_KEEP_COMMENTS | G_KEY_FILE_KEEP_TRANSLATIONS);

    if (!g_key_file_load_from_file(keyfile, path.c_str(), flags, &error)) {
        LOG_WARNING_PAIRS(LOGID_CONF_FILE_ERR, 2, PMLOGKS("path", path.c_str()), PMLOGKS("error", error ? error->message : "unknown"), "using defaults");
        g_key_file_free(keyfile);
        if (error)
            g_error_free(error);
        return false;
    }

    // Fill in with the macros above.
    KEY_STRING("General", "Domain", m_domain);
    if (!validateDomain(m_domain)) {
        LOG_WARNING_PAIRS(LOGID_CONF_VALUE_INVALID, 2, PMLOGKS("key", "Domain"), PMLOGKS("value", m_domain.c_str()), "");
        m_domain = s_defaultDomain;
    }

    KEY_STRING("General", "BasePath", m_basePath);
    //validate path, reset to default if necessary
    if (!validateBasePath(m_basePath)) {
        LOG_WARNING_PAIRS(LOGID_CONF_VALUE_INVALID, 2, PMLOGKS("key", "BasePath"), PMLOGKS("value", m_basePath.c_str()), "");
        m_basePath = s_defaultBasePath;
    }

    KEY_BOOLEAN("General", "StartActive", m_startActive);
    KEY_BOOLEAN("General", "KeepExtension", m_keepExtension);

    KEY_INTEGER("General", "RetryIntervalSeconds", m_retryIntervalSeconds);
    if (m_retryIntervalSeconds < 1) {
        LOG_WARNING_PAIRS(LOGID_CONF_VALUE_INVALID, 2, PMLOGKS("key", "RetryIntervalSeconds"), PMLOGKFV("value", "%d", m_retryIntervalSeconds), "");
        m_retryIntervalSeconds = s_defaultRetryIntervalSeconds;
    }

    KEY_STRING_LIST("Network", "ActiveNetworkTypes", m_activeNetworkTypes);

    KEY_STRING("Database", "Path", m_dbPath);
    if (m_dbPath.empty() || m_dbPath.find("..") != std::string::npos) {
        LOG_WARNING_PAIRS(LOGID_CONF_VALUE_INVALID, 2, PMLOGKS("key", "Database.Path"), PMLOGKS("value", m_dbPath.c_str()), "");
        m_dbPath = s_defaultDbPath;
    }

    g_key_file_free(keyfile);

    LOG_DEBUG("Info: queue settings: domain = %s, basePath = %s, startActive = %d, keepExtension = %d, retry = %ds, db = %s",
            m_domain.c_str(), m_basePath.c_str(), m_startActive, m_keepExtension, m_retryIntervalSeconds, m_dbPath.c_str());
    return true;
}

QueueOptions QueueSettings::toOptions() const
{
    QueueOptions options;
    options.domain = m_domain;
    options.basePath = m_basePath;
    options.startActive = m_startActive;
    options.keepExtension = m_keepExtension;
    options.retryIntervalMs = (int64_t) m_retryIntervalSeconds * 1000;
    options.activeNetworkTypes = m_activeNetworkTypes;
    return options;
}
