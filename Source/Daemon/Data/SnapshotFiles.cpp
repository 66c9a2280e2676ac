/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "SnapshotFiles.hpp"

#include <spdlog/spdlog.h>

#include "Filesystem.hpp"
#include "Json.hpp"
#include "PodStore.hpp"

bool WSnapshotParser::ParsePods(std::string const& Json, std::vector<WPodItem>& OutPods, std::string& OutError)
{
	OutPods.clear();
	std::string Error{};
	auto const  Root = WJson::parse(Json, Error);
	if (!Error.empty())
	{
		OutError = Error;
		return false;
	}
	if (!Root[JSON_KEY_PODS].is_array())
	{
		OutError = "missing 'pods' array";
		return false;
	}

	for (auto const& Item : Root[JSON_KEY_PODS].array_items())
	{
		if (!Item.is_object() || !Item[JSON_KEY_NAME].is_string() || !Item[JSON_KEY_NAMESPACE].is_string())
		{
			spdlog::warn("Skipping pod entry without name/namespace: {}", Item.dump());
			continue;
		}

		WPodItem Pod{};
		Pod.Name = Item[JSON_KEY_NAME].string_value();
		Pod.Namespace = Item[JSON_KEY_NAMESPACE].string_value();
		for (auto const& [Key, Value] : Item[JSON_KEY_LABELS].object_items())
		{
			Pod.Labels[Key] = Value.string_value();
		}
		Pod.Status.Phase = PodPhaseFromString(Item[JSON_KEY_PHASE].string_value());
		Pod.Status.PodIP = Item[JSON_KEY_POD_IP].string_value();
		Pod.Status.HostIP = Item[JSON_KEY_HOST_IP].string_value();
		OutPods.push_back(std::move(Pod));
	}
	return true;
}

bool WSnapshotParser::ParsePolicies(std::string const& Json, WNetworkPolicies& OutPolicies, std::string& OutError)
{
	OutPolicies.clear();
	std::string Error{};
	auto const  Root = WJson::parse(Json, Error);
	if (!Error.empty())
	{
		OutError = Error;
		return false;
	}
	if (!Root[JSON_KEY_POLICIES].is_array())
	{
		OutError = "missing 'policies' array";
		return false;
	}

	for (auto const& Item : Root[JSON_KEY_POLICIES].array_items())
	{
		if (!Item.is_object() || !Item[JSON_KEY_NAME].is_string() || !Item[JSON_KEY_NAMESPACE].is_string())
		{
			spdlog::warn("Skipping policy entry without name/namespace: {}", Item.dump());
			continue;
		}

		WNetworkPolicyInfo Policy{};
		Policy.Name = Item[JSON_KEY_NAME].string_value();
		Policy.Namespace = Item[JSON_KEY_NAMESPACE].string_value();
		for (auto const& Address : Item[JSON_KEY_TARGET_PODS].array_items())
		{
			if (!Address.string_value().empty())
			{
				Policy.TargetPods.insert(Address.string_value());
			}
		}
		for (auto const& Rule : Item[JSON_KEY_RULES].array_items())
		{
			WRuleSpec Spec{};
			for (auto const& Arg : Rule.array_items())
			{
				Spec.push_back(Arg.string_value());
			}
			if (!Spec.empty())
			{
				Policy.ChainRules.push_back(std::move(Spec));
			}
		}
		OutPolicies.push_back(std::move(Policy));
	}
	return true;
}

WPodFileSource::WPodFileSource(
	std::filesystem::path Path_, WPodStore& Store_, std::chrono::milliseconds PollInterval_)
	: Path(std::move(Path_)), Store(Store_), PollInterval(PollInterval_)
{
}

WPodFileSource::~WPodFileSource()
{
	Stop();
}

bool WPodFileSource::Poll()
{
	auto WriteTime = WFilesystem::LastWriteTime(Path);
	if (!WriteTime)
	{
		if (LastWriteTime)
		{
			spdlog::warn("Pods file {} disappeared, keeping the last snapshot", Path.string());
			LastWriteTime.reset();
		}
		return false;
	}
	if (LastWriteTime && *LastWriteTime == *WriteTime)
	{
		return true;
	}

	auto Content = WFilesystem::ReadFile(Path);
	if (!Content)
	{
		spdlog::error("Can't read pods file {}", Path.string());
		return false;
	}

	std::vector<WPodItem> Pods{};
	std::string           Error{};
	if (!WSnapshotParser::ParsePods(*Content, Pods, Error))
	{
		spdlog::error("Failed to parse pods file {}: {}", Path.string(), Error);
		return false;
	}

	LastWriteTime = WriteTime;
	spdlog::debug("Loaded {} pods from {}", Pods.size(), Path.string());
	Store.Replace(Pods);
	return true;
}

void WPodFileSource::PollThreadFunc()
{
	auto NextPoll = std::chrono::steady_clock::now();
	while (bRunning)
	{
		if (std::chrono::steady_clock::now() >= NextPoll)
		{
			Poll();
			NextPoll = std::chrono::steady_clock::now() + PollInterval;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(50));
	}
}

void WPodFileSource::Start()
{
	bRunning = true;
	PollThread = std::thread(&WPodFileSource::PollThreadFunc, this);
}

void WPodFileSource::Stop()
{
	bRunning = false;
	if (PollThread.joinable())
	{
		PollThread.join();
	}
}

bool WPolicyFileSource::GetPolicies(WNetworkPolicies& OutPolicies)
{
	if (!WFilesystem::Exists(Path))
	{
		// no policies means every pod runs through the default chains
		spdlog::debug("Policies file {} does not exist", Path.string());
		OutPolicies.clear();
		return true;
	}

	auto Content = WFilesystem::ReadFile(Path);
	if (!Content)
	{
		spdlog::error("Can't read policies file {}", Path.string());
		return false;
	}

	std::string Error{};
	if (!WSnapshotParser::ParsePolicies(*Content, OutPolicies, Error))
	{
		spdlog::error("Failed to parse policies file {}: {}", Path.string(), Error);
		return false;
	}
	return true;
}
