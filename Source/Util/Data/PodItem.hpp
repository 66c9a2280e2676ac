/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <any>
#include <map>
#include <memory>
#include <string>

#include "Types.hpp"

enum class EPodPhase
{
	Unknown,
	Pending,
	Running,
	Succeeded,
	Failed
};

EPodPhase   PodPhaseFromString(std::string const& Phase);
char const* PodPhaseToString(EPodPhase Phase);

struct WPodStatus
{
	EPodPhase   Phase{ EPodPhase::Unknown };
	WPodAddress PodIP{};  // empty while the pod is being scheduled
	WPodAddress HostIP{}; // address of the node running the pod
};

// Pod object as delivered by the pod cache
struct WPodItem
{
	std::string                        Name{};
	std::string                        Namespace{};
	std::map<std::string, std::string> Labels{};
	WPodStatus                         Status{};

	[[nodiscard]] std::string GetKey() const { return Namespace + "/" + Name; }
};

using WPodItemPtr = std::shared_ptr<WPodItem const>;

// Wraps a deleted object whose final state the cache did not observe.
// Obj normally holds a WPodItemPtr but may hold anything.
struct WDeletedFinalStateUnknown
{
	std::string Key{};
	std::any    Obj{};
};

// Per-sync view of a local pod, keyed by address
struct WPodInfo
{
	WPodAddress                        IP{};
	std::string                        Name{};
	std::string                        Namespace{};
	std::map<std::string, std::string> Labels{};
};
