/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "LocalPods.hpp"

#include <spdlog/spdlog.h>

#include "Data/PodStore.hpp"

bool WLocalPodResolver::GetLocalPods(WPodAddress const& NodeIP, WLocalPods& OutPods) const
{
	OutPods.clear();

	std::vector<WPodItemPtr> Pods{};
	if (!PodLister.List(Pods))
	{
		spdlog::error("Failed to list pods from the pod cache");
		return false;
	}

	for (auto const& Pod : Pods)
	{
		if (!Pod || Pod->Status.HostIP != NodeIP)
		{
			continue;
		}
		if (Pod->Status.PodIP.empty())
		{
			continue;
		}

		OutPods[Pod->Status.PodIP] = WPodInfo{
			.IP = Pod->Status.PodIP,
			.Name = Pod->Name,
			.Namespace = Pod->Namespace,
			.Labels = Pod->Labels,
		};
	}
	return true;
}
