/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include <future>

#include "Sync/SyncScheduler.hpp"

using namespace std::chrono_literals;

namespace
{
	template <typename TPredicate>
	bool WaitFor(TPredicate Predicate, std::chrono::milliseconds Timeout = 5s)
	{
		auto Deadline = std::chrono::steady_clock::now() + Timeout;
		while (!Predicate())
		{
			if (std::chrono::steady_clock::now() > Deadline)
				return false;
			std::this_thread::sleep_for(1ms);
		}
		return true;
	}
} // namespace

TEST(SyncScheduler, RunsFirstPassOnStart)
{
	std::atomic<int> Passes{ 0 };
	WSyncScheduler   Scheduler{ [&] { ++Passes; return true; }, 1h };
	Scheduler.Start();

	EXPECT_TRUE(WaitFor([&] { return Passes == 1; }));
	Scheduler.Stop();
	EXPECT_EQ(Scheduler.GetPassCount(), 1u);
}

TEST(SyncScheduler, RequestsDuringPassCollapseIntoOne)
{
	std::promise<void>       Entered{};
	std::promise<void>       Release{};
	std::shared_future<void> Released = Release.get_future().share();
	std::atomic<int>         Passes{ 0 };

	WSyncScheduler Scheduler{ [&]
		{
			if (++Passes == 1)
			{
				Entered.set_value();
				Released.wait();
			}
			return true;
		},
		1h };
	Scheduler.Start();

	ASSERT_EQ(Entered.get_future().wait_for(5s), std::future_status::ready);
	for (int i = 0; i < 5; ++i)
	{
		Scheduler.RequestFullSync();
	}
	Release.set_value();

	EXPECT_TRUE(WaitFor([&] { return Passes == 2; }));
	std::this_thread::sleep_for(50ms);
	EXPECT_EQ(Passes.load(), 2);
	Scheduler.Stop();
}

TEST(SyncScheduler, PeriodicPassRuns)
{
	std::atomic<int> Passes{ 0 };
	WSyncScheduler   Scheduler{ [&] { ++Passes; return true; }, 10ms };
	Scheduler.Start();

	EXPECT_TRUE(WaitFor([&] { return Passes >= 3; }));
	Scheduler.Stop();
}

TEST(SyncScheduler, CountsFailedPasses)
{
	std::atomic<int> Passes{ 0 };
	WSyncScheduler   Scheduler{ [&] { return ++Passes > 1; }, 1h };
	Scheduler.Start();
	ASSERT_TRUE(WaitFor([&] { return Scheduler.GetPassCount() == 1; }));

	Scheduler.RequestFullSync();
	ASSERT_TRUE(WaitFor([&] { return Scheduler.GetPassCount() == 2; }));
	Scheduler.Stop();

	EXPECT_EQ(Scheduler.GetFailedPassCount(), 1u);
}

TEST(SyncScheduler, StopWithoutStart)
{
	WSyncScheduler Scheduler{ [] { return true; }, 1h };
	Scheduler.Stop();
	EXPECT_EQ(Scheduler.GetPassCount(), 0u);
}
