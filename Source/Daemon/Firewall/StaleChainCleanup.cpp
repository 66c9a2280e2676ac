/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "StaleChainCleanup.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

#include "ChainNamer.hpp"
#include "Iptables/IIptables.hpp"

WStaleChainCleanup::WStaleChainCleanup(IIptables& Iptables_, WFirewallSettings Settings_)
	: Iptables(Iptables_), Settings(std::move(Settings_))
{
}

WChainName WStaleChainCleanup::JumpTarget(WRuleSpec const& Spec)
{
	for (size_t i = 0; i + 1 < Spec.size(); ++i)
	{
		if (Spec[i] == "-j" || Spec[i] == "--jump")
		{
			return Spec[i + 1];
		}
	}
	return {};
}

bool WStaleChainCleanup::RemoveReferences(WChainName const& Chain, std::unordered_set<WChainName> const& StaleChains)
{
	std::vector<WRuleSpec> Rules{};
	if (auto Status = Iptables.List(Settings.Table, Chain, Rules); !Status.IsOk())
	{
		spdlog::error("Failed to list rules of {}: {}", Chain, Status.Describe());
		return false;
	}

	bool bOk = true;
	for (auto const& Rule : Rules)
	{
		if (!StaleChains.contains(JumpTarget(Rule)))
		{
			continue;
		}
		if (auto Status = Iptables.Delete(Settings.Table, Chain, Rule); !Status.IsOkOrConflict())
		{
			spdlog::error("Failed to delete jump from {} to {}: {}", Chain, JumpTarget(Rule), Status.Describe());
			bOk = false;
		}
	}
	return bOk;
}

bool WStaleChainCleanup::Cleanup(WActiveChainSet const& ActiveChains)
{
	std::vector<WChainName> Chains{};
	if (auto Status = Iptables.ListChains(Settings.Table, Chains); !Status.IsOk())
	{
		spdlog::error("Failed to list chains: {}", Status.Describe());
		return false;
	}

	std::unordered_set<WChainName> StaleChains{};
	std::vector<WChainName>        ActivePodChains{};
	for (auto const& Chain : Chains)
	{
		if (!WChainNamer::IsPodFirewallChain(Chain) && !WChainNamer::IsNetworkPolicyChain(Chain))
		{
			continue;
		}
		if (auto It = ActiveChains.find(Chain); It != ActiveChains.end() && It->second)
		{
			if (WChainNamer::IsPodFirewallChain(Chain))
			{
				ActivePodChains.push_back(Chain);
			}
			continue;
		}
		StaleChains.insert(Chain);
	}

	if (StaleChains.empty())
	{
		return true;
	}

	// stale pod chains are referenced from the global chains, stale policy
	// chains from active pod chains. Stale pod chains get flushed below.
	std::vector<WChainName> Referrers{ Settings.InputChain, Settings.ForwardChain, Settings.OutputChain };
	Referrers.insert(Referrers.end(), ActivePodChains.begin(), ActivePodChains.end());

	bool bOk = true;
	for (auto const& Chain : Referrers)
	{
		if (!RemoveReferences(Chain, StaleChains))
		{
			bOk = false;
		}
	}

	// pod chains first, they jump to policy chains
	std::vector<WChainName> Ordered(StaleChains.begin(), StaleChains.end());
	std::ranges::stable_partition(Ordered, [](WChainName const& Chain) { return WChainNamer::IsPodFirewallChain(Chain); });

	for (auto const& Chain : Ordered)
	{
		if (auto Status = Iptables.ClearChain(Settings.Table, Chain); !Status.IsOkOrConflict())
		{
			spdlog::error("Failed to flush stale chain {}: {}", Chain, Status.Describe());
			bOk = false;
			continue;
		}
		if (auto Status = Iptables.DeleteChain(Settings.Table, Chain); !Status.IsOkOrConflict())
		{
			spdlog::error("Failed to delete stale chain {}: {}", Chain, Status.Describe());
			bOk = false;
			continue;
		}
		spdlog::debug("Deleted stale chain {}", Chain);
	}

	spdlog::info("Cleaned up {} stale chains", StaleChains.size());
	return bOk;
}
