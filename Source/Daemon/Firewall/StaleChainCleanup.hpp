/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <unordered_set>
#include <vector>

#include "Types.hpp"
#include "FirewallSettings.hpp"

class IIptables;

// Removes pod and policy chains of previous generations
class WStaleChainCleanup
{
	IIptables&        Iptables;
	WFirewallSettings Settings;

	bool RemoveReferences(WChainName const& Chain, std::unordered_set<WChainName> const& StaleChains);

public:
	WStaleChainCleanup(IIptables& Iptables_, WFirewallSettings Settings_);

	// Deletes every managed chain missing from ActiveChains after unhooking it
	// from the chains that still jump to it. Keeps going after a failure,
	// returns false if anything could not be removed.
	bool Cleanup(WActiveChainSet const& ActiveChains);

	// Target of "-j <target>", empty if the rule has none
	static WChainName JumpTarget(WRuleSpec const& Spec);
};
