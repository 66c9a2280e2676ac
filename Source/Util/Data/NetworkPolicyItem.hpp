/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <unordered_set>
#include <vector>

#include "Types.hpp"

// Network policy after selector resolution. The chain holding the policy's
// own rules is named from Namespace, Name and the sync generation.
struct WNetworkPolicyInfo
{
	std::string                     Name{};
	std::string                     Namespace{};
	std::unordered_set<WPodAddress> TargetPods{};

	// Rules of the policy chain as produced by the resolver. They are expected
	// to set the provisional pass mark on packets the policy permits.
	std::vector<WRuleSpec> ChainRules{};

	[[nodiscard]] bool Targets(WPodAddress const& Address) const { return TargetPods.contains(Address); }
};

using WNetworkPolicies = std::vector<WNetworkPolicyInfo>;
