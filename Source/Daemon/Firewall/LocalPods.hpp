/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <map>

#include "Types.hpp"
#include "Data/PodItem.hpp"

class IPodLister;

using WLocalPods = std::map<WPodAddress, WPodInfo>;

class WLocalPodResolver
{
	IPodLister const& PodLister;

public:
	explicit WLocalPodResolver(IPodLister const& PodLister_)
		: PodLister(PodLister_)
	{
	}

	// Pods hosted on NodeIP that already have an address. Pods still being
	// scheduled are skipped. An empty result is not an error, false means the
	// pod cache could not be read.
	bool GetLocalPods(WPodAddress const& NodeIP, WLocalPods& OutPods) const;
};
