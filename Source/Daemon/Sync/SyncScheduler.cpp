/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "SyncScheduler.hpp"

#include <spdlog/spdlog.h>

WSyncScheduler::WSyncScheduler(std::function<bool()> SyncFunc_, std::chrono::milliseconds SyncPeriod_)
	: SyncFunc(std::move(SyncFunc_)), SyncPeriod(SyncPeriod_)
{
}

WSyncScheduler::~WSyncScheduler()
{
	Stop();
}

void WSyncScheduler::WorkerThreadFunc()
{
	auto NextPeriodicSync = std::chrono::steady_clock::now();
	while (bRunning)
	{
		{
			std::unique_lock Lock(Mutex);
			Wakeup.wait_until(Lock, NextPeriodicSync, [this] { return bPending || !bRunning; });
			if (!bRunning)
			{
				break;
			}
			if (!bPending && std::chrono::steady_clock::now() < NextPeriodicSync)
			{
				continue;
			}
			// everything requested up to here is covered by this pass
			bPending = false;
		}

		++PassCount;
		if (!SyncFunc())
		{
			++FailedPassCount;
			spdlog::warn("Sync pass failed, retrying with the next request or in {}s",
				std::chrono::duration_cast<std::chrono::seconds>(SyncPeriod).count());
		}
		NextPeriodicSync = std::chrono::steady_clock::now() + SyncPeriod;
	}
}

void WSyncScheduler::Start()
{
	if (bRunning.exchange(true))
	{
		return;
	}
	WorkerThread = std::thread(&WSyncScheduler::WorkerThreadFunc, this);
}

void WSyncScheduler::Stop()
{
	{
		std::lock_guard Lock(Mutex);
		bRunning = false;
	}
	Wakeup.notify_all();
	if (WorkerThread.joinable())
	{
		WorkerThread.join();
	}
}

void WSyncScheduler::RequestFullSync()
{
	{
		std::lock_guard Lock(Mutex);
		bPending = true;
	}
	Wakeup.notify_one();
}
