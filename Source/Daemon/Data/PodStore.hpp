/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "Data/PodItem.hpp"

class IPodLister
{
public:
	IPodLister() = default;
	virtual ~IPodLister() = default;

	// Every pod known to the cache, false if the cache can't be read
	virtual bool List(std::vector<WPodItemPtr>& OutPods) const = 0;
};

// Pod cache keyed by namespace/name. Mutations are announced through WPodEvents.
class WPodStore final : public IPodLister
{
	mutable std::mutex                           Mutex;
	std::unordered_map<std::string, WPodItemPtr> Pods{};

public:
	bool List(std::vector<WPodItemPtr>& OutPods) const override;

	void Upsert(WPodItem const& Pod);
	void Remove(std::string const& Key);

	// Makes the cache hold exactly Pods, firing add/update/delete for the difference
	void Replace(std::vector<WPodItem> const& NewPods);

	[[nodiscard]] size_t Size() const;
};
