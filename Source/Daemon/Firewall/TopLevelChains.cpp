/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "TopLevelChains.hpp"

#include <spdlog/spdlog.h>

#include "PodRuleSpecs.hpp"
#include "Iptables/IIptables.hpp"

WTopLevelChains::WTopLevelChains(IIptables& Iptables_, WFirewallSettings Settings_)
	: Iptables(Iptables_), Settings(std::move(Settings_))
{
}

bool WTopLevelChains::EnsureChain(WChainName const& Chain)
{
	if (auto Status = Iptables.NewChain(Settings.Table, Chain); !Status.IsOkOrConflict())
	{
		spdlog::error("Failed to create chain {}: {}", Chain, Status.Describe());
		return false;
	}
	return true;
}

bool WTopLevelChains::EnsureHook(std::string const& BuiltinChain, WChainName const& Chain)
{
	WRuleSpec Spec{ "-m", "comment", "--comment", "wehr netpol - run through " + Chain, "-j", Chain };

	bool bExists = false;
	if (auto Status = Iptables.Exists(Settings.Table, BuiltinChain, Spec, bExists); !Status.IsOk())
	{
		spdlog::error("Failed to check hook {} -> {}: {}", BuiltinChain, Chain, Status.Describe());
		return false;
	}
	if (bExists)
	{
		return true;
	}
	if (auto Status = Iptables.Insert(Settings.Table, BuiltinChain, 1, Spec); !Status.IsOk())
	{
		spdlog::error("Failed to hook {} into {}: {}", Chain, BuiltinChain, Status.Describe());
		return false;
	}
	spdlog::info("Hooked {} into {}", Chain, BuiltinChain);
	return true;
}

static WRuleSpec AcceptMarkedSpec()
{
	return { "-m", "comment", "--comment", "rule to explicitly ACCEPT traffic that comply to network policies", "-m",
		"mark", "--mark", WPodRuleSpecs::FormatMark(EFirewallMark::FinalPass, EFirewallMark::FinalPass), "-j",
		"ACCEPT" };
}

bool WTopLevelChains::Ensure()
{
	std::pair<char const*, WChainName const&> const Hooks[] = {
		{ "INPUT", Settings.InputChain },
		{ "FORWARD", Settings.ForwardChain },
		{ "OUTPUT", Settings.OutputChain },
	};

	for (auto const& [Builtin, Chain] : Hooks)
	{
		if (!EnsureChain(Chain) || !EnsureHook(Builtin, Chain))
		{
			return false;
		}
	}

	WRuleSpec MarkPermitted{ "-m", "comment", "--comment", "rule to mark traffic of pods without network policies",
		"-j", "MARK", "--set-mark",
		WPodRuleSpecs::FormatMark(EFirewallMark::ProvisionalPass, EFirewallMark::ProvisionalPass) };

	for (auto const& Chain : { Settings.DefaultIngressChain, Settings.DefaultEgressChain })
	{
		if (!EnsureChain(Chain))
		{
			return false;
		}
		if (auto Status = Iptables.AppendUnique(Settings.Table, Chain, MarkPermitted); !Status.IsOk())
		{
			spdlog::error("Failed to add mark rule to {}: {}", Chain, Status.Describe());
			return false;
		}
	}
	return true;
}

bool WTopLevelChains::EnsureExplicitAccept()
{
	auto const Spec = AcceptMarkedSpec();
	for (auto const& Chain : { Settings.InputChain, Settings.ForwardChain, Settings.OutputChain })
	{
		// pod jumps get appended during a sync, move the accept rule behind them
		if (auto Status = Iptables.Delete(Settings.Table, Chain, Spec); !Status.IsOkOrConflict())
		{
			spdlog::error("Failed to remove accept rule from {}: {}", Chain, Status.Describe());
			return false;
		}
		if (auto Status = Iptables.Append(Settings.Table, Chain, Spec); !Status.IsOk())
		{
			spdlog::error("Failed to add accept rule to {}: {}", Chain, Status.Describe());
			return false;
		}
	}
	return true;
}
