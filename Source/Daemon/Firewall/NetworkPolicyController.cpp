/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "NetworkPolicyController.hpp"

#include <chrono>
#include <spdlog/spdlog.h>

#include "ChainNamer.hpp"
#include "Data/PolicySource.hpp"
#include "Iptables/IIptables.hpp"

WNetworkPolicyController::WNetworkPolicyController(IIptables& Iptables_, IPodLister const& PodLister,
	IPolicySource& PolicySource_, WFirewallSettings Settings_, WPodAddress NodeIP)
	: Iptables(Iptables_)
	, PolicySource(PolicySource_)
	, Settings(std::move(Settings_))
	, PodResolver(PodLister)
	, PodSync(Iptables_, PodResolver, Settings, std::move(NodeIP))
	, TopLevelChains(Iptables_, Settings)
	, Cleanup(Iptables_, Settings)
{
}

WGeneration WNetworkPolicyController::MakeGeneration()
{
	auto Now = std::chrono::system_clock::now().time_since_epoch();
	return std::to_string(std::chrono::duration_cast<std::chrono::nanoseconds>(Now).count());
}

bool WNetworkPolicyController::EnsurePolicyChains(
	WNetworkPolicies const& Policies, WGeneration const& Version, WActiveChainSet& OutActiveChains)
{
	for (auto const& Policy : Policies)
	{
		auto Chain = WChainNamer::NetworkPolicyChainName(Policy.Namespace, Policy.Name, Version);
		if (auto Status = Iptables.NewChain(Settings.Table, Chain); !Status.IsOkOrConflict())
		{
			spdlog::error("Failed to create chain {} for policy {}/{}: {}", Chain, Policy.Namespace, Policy.Name,
				Status.Describe());
			return false;
		}
		for (auto const& Rule : Policy.ChainRules)
		{
			if (auto Status = Iptables.AppendUnique(Settings.Table, Chain, Rule); !Status.IsOk())
			{
				spdlog::error(
					"Failed to add rule to chain {} of policy {}: {}", Chain, Policy.Name, Status.Describe());
				return false;
			}
		}
		OutActiveChains[Chain] = true;
	}
	return true;
}

bool WNetworkPolicyController::FullSync()
{
	return FullSync(MakeGeneration());
}

bool WNetworkPolicyController::FullSync(WGeneration const& Version)
{
	std::lock_guard Lock(SyncMutex);
	auto            Start = std::chrono::steady_clock::now();

	WNetworkPolicies Policies{};
	if (!PolicySource.GetPolicies(Policies))
	{
		spdlog::error("Aborting sync: failed to get network policies");
		return false;
	}

	if (!TopLevelChains.Ensure())
	{
		spdlog::error("Aborting sync: failed to set up top level chains");
		return false;
	}

	WActiveChainSet ActiveChains{};
	if (!EnsurePolicyChains(Policies, Version, ActiveChains))
	{
		spdlog::error("Aborting sync: failed to set up network policy chains");
		return false;
	}

	auto ActivePodChains = PodSync.SyncPodFirewallChains(Policies, Version);
	if (!ActivePodChains)
	{
		spdlog::error("Aborting sync: failed to sync pod firewall chains: {}", PodSync.GetLastError());
		return false;
	}
	ActiveChains.insert(ActivePodChains->begin(), ActivePodChains->end());

	if (!TopLevelChains.EnsureExplicitAccept())
	{
		spdlog::error("Aborting sync: failed to set up accept rules");
		return false;
	}

	// the new generation is wired in, previous chains can go
	bool bCleanedUp = Cleanup.Cleanup(ActiveChains);
	LastVersion = Version;

	auto Elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - Start);
	spdlog::info("Synced {} policies and {} pod chains (generation {}) in {} ms", Policies.size(),
		ActivePodChains->size(), Version, Elapsed.count());
	return bCleanedUp;
}
