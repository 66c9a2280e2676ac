/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

using WPodAddress = std::string;
using WChainName = std::string;
using WGeneration = std::string;

// Arguments of a single iptables rule, without table/chain/command
using WRuleSpec = std::vector<std::string>;

// Chain name -> in use. Everything absent is garbage collected after a pass.
using WActiveChainSet = std::unordered_map<WChainName, bool>;

// Mark bits shared with the network policy chains
namespace EFirewallMark
{
	// set by a policy chain when one of its rules permits the packet
	constexpr uint32_t ProvisionalPass = 0x10000;
	// set by the pod chain tail once the packet survived the drop rules
	constexpr uint32_t FinalPass = 0x20000;
} // namespace EFirewallMark
