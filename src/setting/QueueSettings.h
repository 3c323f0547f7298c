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

#ifndef SETTING_QUEUESETTINGS_H_
#define SETTING_QUEUESETTINGS_H_

#include <string>
#include <vector>
#include <stdint.h>

#include <core/DownloadQueue.h>

class QueueSettings {
public:
    static const char* DEFAULT_SETTINGS_FILE;

    QueueSettings();
    ~QueueSettings();

    std::string m_domain;                           //main
    std::string m_basePath;                         //default >> /media/internal/downloadqueue
    bool m_startActive;                             //true
    bool m_keepExtension;                           //true. keep ".mp3" etc from the url on the local file
    int m_retryIntervalSeconds;                     //60
    std::vector<std::string> m_activeNetworkTypes;  //empty >> any connection
    std::string m_dbPath;                           //default >> /var/lib/downloadqueue/records.db

    //! Overlay values from a key file. false if the file couldn't be read; defaults stay in place.
    bool load(const std::string& path = DEFAULT_SETTINGS_FILE);

    //! Options for DownloadQueue::init(); handlers and network monitor are left for the caller
    QueueOptions toOptions() const;

    static bool validateBasePath(const std::string& path);
    static bool validateDomain(const std::string& domain);
};

#endif /* SETTING_QUEUESETTINGS_H_ */
