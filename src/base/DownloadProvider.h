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

#ifndef BASE_DOWNLOADPROVIDER_H_
#define BASE_DOWNLOADPROVIDER_H_

#include <string>
#include <vector>
#include <memory>
#include <base/DownloadTask.h>

// Transport that performs the actual transfers, possibly outliving the
// process (background sessions). Task ids are chosen by the caller.
class DownloadProvider {
public:
    virtual ~DownloadProvider()
    {
    }

    virtual std::shared_ptr<DownloadTask> startTransfer(const std::string& id, const std::string& url, const std::string& destinationPath) = 0;

    // Tasks the transport still knows about from a previous session
    virtual void listInFlightTasks(std::vector<std::shared_ptr<DownloadTask> >& r_tasks) = 0;

    // Called once a finished transfer has been recorded
    virtual void completeTransfer(const std::string& id)
    {
    }
};

#endif /*BASE_DOWNLOADPROVIDER_H_*/
