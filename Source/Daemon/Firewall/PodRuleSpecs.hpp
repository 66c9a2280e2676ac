/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <string>

#include "Types.hpp"
#include "Data/PodItem.hpp"

struct WFirewallSettings;

// Rule specs installed into pod chains and the global chains. Comments carry
// pod name, namespace and purpose and only depend on their inputs.
class WPodRuleSpecs
{
public:
	// "0x10000/0x10000" style value/mask
	static std::string FormatMark(uint32_t Value, uint32_t Mask);

	static WRuleSpec PolicyJump(std::string const& PolicyName, WChainName const& PolicyChain);
	static WRuleSpec DefaultIngressJump(WPodInfo const& Pod, WChainName const& DefaultChain);
	static WRuleSpec DefaultEgressJump(WPodInfo const& Pod, WChainName const& DefaultChain);

	static WRuleSpec LocalNodeAllow(WPodInfo const& Pod);
	static WRuleSpec StatefulAllow();

	static WRuleSpec InboundJump(WPodInfo const& Pod, WChainName const& PodChain);
	static WRuleSpec InboundBridgedJump(WPodInfo const& Pod, WChainName const& PodChain);
	static WRuleSpec OutboundJump(WPodInfo const& Pod, WChainName const& PodChain);
	static WRuleSpec OutboundBridgedJump(WPodInfo const& Pod, WChainName const& PodChain);

	static WRuleSpec DropLog(WPodInfo const& Pod, WFirewallSettings const& Settings);
	static WRuleSpec DropReject(WPodInfo const& Pod);

	static WRuleSpec MarkReset();
	static WRuleSpec MarkAccept();
};
