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

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <core/RetryEngine.h>

#include "support/ManualTimerScheduler.h"

class RetryEngineTest: public ::testing::Test {
protected:
    RetryEngineTest()
        : m_retry(&m_timers, std::bind(&RetryEngineTest::onRetry, this, std::placeholders::_1), 1000)
    {
    }

    void onRetry(const std::string& id)
    {
        m_retried.push_back(id);
        if (id == m_failAgain)
            m_retry.add(id);
    }

    ManualTimerScheduler m_timers;
    std::vector<std::string> m_retried;
    std::string m_failAgain;
    RetryEngine m_retry;
};

TEST_F(RetryEngineTest, TimerArmedLazilyOnFirstAdd)
{
    EXPECT_FALSE(m_retry.isTimerArmed());
    EXPECT_EQ(0u, m_timers.pendingCount());

    m_retry.add("a");
    m_retry.add("b");

    EXPECT_TRUE(m_retry.isTimerArmed());
    EXPECT_EQ(1u, m_timers.pendingCount());
    EXPECT_EQ(2u, m_retry.size());
}

TEST_F(RetryEngineTest, FiringDrainsSetAndStops)
{
    m_retry.add("a");
    m_retry.add("b");

    m_timers.advance(999);
    EXPECT_TRUE(m_retried.empty());

    m_timers.advance(1);
    ASSERT_EQ(2u, m_retried.size());
    EXPECT_EQ(0u, m_retry.size());
    EXPECT_FALSE(m_retry.isTimerArmed());
    EXPECT_EQ(0u, m_timers.pendingCount());
}

TEST_F(RetryEngineTest, FailedRetryComesBackForNextRound)
{
    m_failAgain = "a";
    m_retry.add("a");

    m_timers.advance(1000);
    EXPECT_EQ(1u, m_retried.size());
    EXPECT_TRUE(m_retry.contains("a"));
    EXPECT_TRUE(m_retry.isTimerArmed());

    m_timers.advance(1000);
    EXPECT_EQ(2u, m_retried.size());
}

TEST_F(RetryEngineTest, RemovingLastIdDisarms)
{
    m_retry.add("a");
    m_retry.remove("a");

    EXPECT_FALSE(m_retry.isTimerArmed());
    EXPECT_EQ(0u, m_timers.pendingCount());

    m_timers.advance(5000);
    EXPECT_TRUE(m_retried.empty());
}

TEST_F(RetryEngineTest, SuspendKeepsIdsButStopsTimer)
{
    m_retry.add("a");
    m_retry.suspend();

    EXPECT_TRUE(m_retry.isSuspended());
    EXPECT_FALSE(m_retry.isTimerArmed());
    m_timers.advance(10000);
    EXPECT_TRUE(m_retried.empty());

    // errors arriving while suspended are queued only
    m_retry.add("b");
    EXPECT_FALSE(m_retry.isTimerArmed());

    m_retry.unsuspend();
    EXPECT_TRUE(m_retry.isTimerArmed());
    m_timers.advance(1000);
    EXPECT_EQ(2u, m_retried.size());
}

TEST_F(RetryEngineTest, UnsuspendWithNothingQueuedStaysIdle)
{
    m_retry.suspend();
    m_retry.unsuspend();
    EXPECT_FALSE(m_retry.isTimerArmed());
}

TEST_F(RetryEngineTest, ClearCancelsPendingRetries)
{
    m_retry.add("a");
    m_retry.clear();

    EXPECT_EQ(0u, m_retry.size());
    EXPECT_EQ(0u, m_timers.pendingCount());
}

TEST_F(RetryEngineTest, IntervalMustBePositive)
{
    m_retry.setInterval(0);
    m_retry.add("a");
    EXPECT_EQ(m_timers.now() + 1000, m_timers.nextDue());

    m_retry.clear();
    m_retry.setInterval(250);
    m_retry.add("a");
    EXPECT_EQ(m_timers.now() + 250, m_timers.nextDue());
}
