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

#ifndef BASE_TIMERSCHEDULER_H_
#define BASE_TIMERSCHEDULER_H_

#include <functional>
#include <stdint.h>

// Wall clock and one-shot timers
class TimerScheduler {
public:
    typedef unsigned long TimerId;
    typedef std::function<void()> Callback;

    virtual ~TimerScheduler()
    {
    }

    // epoch milliseconds
    virtual int64_t now() = 0;

    // returns a non-zero id; the callback runs at most once
    virtual TimerId schedule(int64_t delayMs, Callback callback) = 0;

    // no-op for ids that already fired or were cancelled
    virtual void cancel(TimerId timerId) = 0;
};

#endif /*BASE_TIMERSCHEDULER_H_*/
