/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "PodStore.hpp"

#include <spdlog/spdlog.h>
#include <unordered_set>

#include "PodEvents.hpp"

static bool PodEquals(WPodItem const& A, WPodItem const& B)
{
	return A.Name == B.Name && A.Namespace == B.Namespace && A.Labels == B.Labels
		&& A.Status.Phase == B.Status.Phase && A.Status.PodIP == B.Status.PodIP
		&& A.Status.HostIP == B.Status.HostIP;
}

bool WPodStore::List(std::vector<WPodItemPtr>& OutPods) const
{
	std::lock_guard Lock(Mutex);
	OutPods.clear();
	OutPods.reserve(Pods.size());
	for (auto const& [Key, Pod] : Pods)
	{
		OutPods.push_back(Pod);
	}
	return true;
}

void WPodStore::Upsert(WPodItem const& Pod)
{
	auto        NewPod = std::make_shared<WPodItem const>(Pod);
	WPodItemPtr OldPod{};
	{
		std::lock_guard Lock(Mutex);
		auto&           Slot = Pods[Pod.GetKey()];
		OldPod = Slot;
		if (OldPod && PodEquals(*OldPod, Pod))
		{
			return;
		}
		Slot = NewPod;
	}

	// signals are emitted without holding the lock, slots may call List()
	if (OldPod)
	{
		WPodEvents::GetInstance().OnPodUpdated(OldPod, NewPod);
	}
	else
	{
		WPodEvents::GetInstance().OnPodAdded(NewPod);
	}
}

void WPodStore::Remove(std::string const& Key)
{
	WPodItemPtr OldPod{};
	{
		std::lock_guard Lock(Mutex);
		auto            It = Pods.find(Key);
		if (It == Pods.end())
		{
			return;
		}
		OldPod = It->second;
		Pods.erase(It);
	}
	WPodEvents::GetInstance().OnPodDeleted(std::any(OldPod));
}

void WPodStore::Replace(std::vector<WPodItem> const& NewPods)
{
	std::unordered_set<std::string> Seen{};
	for (auto const& Pod : NewPods)
	{
		if (!Seen.insert(Pod.GetKey()).second)
		{
			spdlog::warn("Duplicate pod {} in snapshot, keeping the first entry", Pod.GetKey());
			continue;
		}
		Upsert(Pod);
	}

	std::vector<std::string> Removed{};
	{
		std::lock_guard Lock(Mutex);
		for (auto const& [Key, Pod] : Pods)
		{
			if (!Seen.contains(Key))
			{
				Removed.push_back(Key);
			}
		}
	}
	for (auto const& Key : Removed)
	{
		Remove(Key);
	}
}

size_t WPodStore::Size() const
{
	std::lock_guard Lock(Mutex);
	return Pods.size();
}
