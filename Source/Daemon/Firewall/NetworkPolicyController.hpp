/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <mutex>
#include <string>

#include "Types.hpp"
#include "FirewallSettings.hpp"
#include "PodFirewallSync.hpp"
#include "StaleChainCleanup.hpp"
#include "TopLevelChains.hpp"

class IIptables;
class IPodLister;
class IPolicySource;

// One full reconciliation: global chains, policy chains, pod chains, cleanup
class WNetworkPolicyController
{
	IIptables&        Iptables;
	IPolicySource&    PolicySource;
	WFirewallSettings Settings;

	WLocalPodResolver  PodResolver;
	WPodFirewallSync   PodSync;
	WTopLevelChains    TopLevelChains;
	WStaleChainCleanup Cleanup;

	std::mutex  SyncMutex;
	WGeneration LastVersion{};

	bool EnsurePolicyChains(
		WNetworkPolicies const& Policies, WGeneration const& Version, WActiveChainSet& OutActiveChains);

public:
	WNetworkPolicyController(IIptables& Iptables_, IPodLister const& PodLister, IPolicySource& PolicySource_,
		WFirewallSettings Settings_, WPodAddress NodeIP);

	bool FullSync();
	bool FullSync(WGeneration const& Version);

	// Current time in nanoseconds, unique per pass
	static WGeneration MakeGeneration();

	[[nodiscard]] WGeneration const& GetLastVersion() const { return LastVersion; }
};
