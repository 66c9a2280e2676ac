/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "PolicySource.hpp"
#include "Data/PodItem.hpp"

class WPodStore;

/**
 * Pod and policy snapshots exported as JSON files by the cluster agent.
 *
 * pods:     { "pods": [ { "name", "namespace", "labels": {}, "phase", "podIP", "hostIP" } ] }
 * policies: { "policies": [ { "name", "namespace", "targetPods": [], "rules": [ [ "-s", ... ] ] } ] }
 */
class WSnapshotParser
{
public:
	static bool ParsePods(std::string const& Json, std::vector<WPodItem>& OutPods, std::string& OutError);
	static bool ParsePolicies(std::string const& Json, WNetworkPolicies& OutPolicies, std::string& OutError);
};

// Polls the pods file and mirrors it into the pod store
class WPodFileSource
{
	std::filesystem::path     Path;
	WPodStore&                Store;
	std::chrono::milliseconds PollInterval;

	std::optional<std::filesystem::file_time_type> LastWriteTime{};

	std::thread       PollThread;
	std::atomic<bool> bRunning{ false };

	void PollThreadFunc();

public:
	WPodFileSource(std::filesystem::path Path_, WPodStore& Store_, std::chrono::milliseconds PollInterval_);
	~WPodFileSource();

	// Reloads the file if it changed since the last call
	bool Poll();

	void Start();
	void Stop();
};

class WPolicyFileSource final : public IPolicySource
{
	std::filesystem::path Path;

public:
	explicit WPolicyFileSource(std::filesystem::path Path_)
		: Path(std::move(Path_))
	{
	}

	bool GetPolicies(WNetworkPolicies& OutPolicies) override;
};
