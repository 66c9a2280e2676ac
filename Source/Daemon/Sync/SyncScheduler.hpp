/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

/**
 * Runs sync passes on a single worker thread. Requests made while a pass is
 * pending collapse into that pass, requests made while a pass is running
 * schedule exactly one more. A pass also runs every SyncPeriod.
 */
class WSyncScheduler
{
	std::function<bool()>     SyncFunc;
	std::chrono::milliseconds SyncPeriod;

	std::thread             WorkerThread;
	std::atomic<bool>       bRunning{ false };
	std::mutex              Mutex;
	std::condition_variable Wakeup;
	bool                    bPending{ false };

	std::atomic<uint64_t> PassCount{ 0 };
	std::atomic<uint64_t> FailedPassCount{ 0 };

	void WorkerThreadFunc();

public:
	WSyncScheduler(std::function<bool()> SyncFunc_, std::chrono::milliseconds SyncPeriod_);
	~WSyncScheduler();

	void Start();
	void Stop();

	void RequestFullSync();

	[[nodiscard]] uint64_t GetPassCount() const { return PassCount; }
	[[nodiscard]] uint64_t GetFailedPassCount() const { return FailedPassCount; }
};
