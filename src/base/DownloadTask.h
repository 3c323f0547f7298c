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

#ifndef BASE_DOWNLOADTASK_H_
#define BASE_DOWNLOADTASK_H_

#include <string>
#include <functional>
#include <stdint.h>

// Handle to a transfer owned by a DownloadProvider. The queue registers one
// handler per event and drives the transfer through pause/resume/stop.
class DownloadTask {
public:
    enum State {
        STATE_DOWNLOADING,
        STATE_PAUSED,
        STATE_DONE,
        STATE_STOPPED,
        STATE_FAILED,
        STATE_UNKNOWN
    };

    typedef std::function<void(uint64_t totalBytes)> BeginHandler;
    typedef std::function<void(double fraction, uint64_t bytesCompleted, uint64_t bytesTotal)> ProgressHandler;
    typedef std::function<void()> DoneHandler;
    typedef std::function<void(const std::string& message, int code)> ErrorHandler;

    virtual ~DownloadTask()
    {
    }

    virtual std::string id() const = 0;
    virtual State state() const = 0;
    virtual uint64_t bytesTotal() const = 0;

    // Registering a handler replaces the previous one for that event
    virtual DownloadTask& begin(BeginHandler handler) = 0;
    virtual DownloadTask& progress(ProgressHandler handler) = 0;
    virtual DownloadTask& done(DoneHandler handler) = 0;
    virtual DownloadTask& error(ErrorHandler handler) = 0;

    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void stop() = 0;

    static const char* stateName(State state)
    {
        switch (state) {
        case STATE_DOWNLOADING:
            return "downloading";
        case STATE_PAUSED:
            return "paused";
        case STATE_DONE:
            return "done";
        case STATE_STOPPED:
            return "stopped";
        case STATE_FAILED:
            return "failed";
        default:
            return "unknown";
        }
    }
};

#endif /*BASE_DOWNLOADTASK_H_*/
