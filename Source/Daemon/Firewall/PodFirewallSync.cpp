/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "PodFirewallSync.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "ChainNamer.hpp"
#include "PodRuleSpecs.hpp"
#include "Iptables/IIptables.hpp"

WPodFirewallSync::WPodFirewallSync(
	IIptables& Iptables_, WLocalPodResolver const& PodResolver_, WFirewallSettings Settings_, WPodAddress NodeIP_)
	: Iptables(Iptables_), PodResolver(PodResolver_), Settings(std::move(Settings_)), NodeIP(std::move(NodeIP_))
{
}

bool WPodFirewallSync::Fail(std::string Error)
{
	spdlog::error("{}", Error);
	LastError = std::move(Error);
	return false;
}

bool WPodFirewallSync::Check(WIptablesStatus const& Status, std::string const& Context)
{
	if (Status.IsOk())
	{
		return true;
	}
	return Fail(fmt::format("{}: failed to run iptables command: {}", Context, Status.Describe()));
}

bool WPodFirewallSync::InsertIfMissing(WChainName const& Chain, WRuleSpec const& Spec, std::string const& Context)
{
	bool bExists = false;
	if (!Check(Iptables.Exists(Settings.Table, Chain, Spec, bExists), Context))
	{
		return false;
	}
	if (bExists)
	{
		return true;
	}

	// -C just reported the rule absent, so exit status 1 from -I is a real
	// failure (missing chain, target or match module)
	return Check(Iptables.Insert(Settings.Table, Chain, 1, Spec), Context);
}

bool WPodFirewallSync::AppendIfMissing(WChainName const& Chain, WRuleSpec const& Spec, std::string const& Context)
{
	return Check(Iptables.AppendUnique(Settings.Table, Chain, Spec), Context);
}

bool WPodFirewallSync::InsertPolicyJumps(WPodInfo const& Pod, WChainName const& PodChain,
	WNetworkPolicies const& Policies, WGeneration const& Version, bool& bOutAnyMatched)
{
	bOutAnyMatched = false;
	for (auto const& Policy : Policies)
	{
		if (!Policy.Targets(Pod.IP))
		{
			continue;
		}
		bOutAnyMatched = true;

		auto PolicyChain = WChainNamer::NetworkPolicyChainName(Policy.Namespace, Policy.Name, Version);
		auto Context = fmt::format("jump to policy {}/{} for pod {}/{}", Policy.Namespace, Policy.Name,
			Pod.Namespace, Pod.Name);
		if (!InsertIfMissing(PodChain, WPodRuleSpecs::PolicyJump(Policy.Name, PolicyChain), Context))
		{
			return false;
		}
	}
	return true;
}

bool WPodFirewallSync::SetupPodIngressRules(
	WPodInfo const& Pod, WChainName const& PodChain, WNetworkPolicies const& Policies, WGeneration const& Version)
{
	bool bIngressPoliciesPresent = false;
	if (!InsertPolicyJumps(Pod, PodChain, Policies, Version, bIngressPoliciesPresent))
	{
		return false;
	}

	auto Context = fmt::format("ingress rules for pod {}/{}", Pod.Namespace, Pod.Name);
	if (!bIngressPoliciesPresent
		&& !InsertIfMissing(PodChain, WPodRuleSpecs::DefaultIngressJump(Pod, Settings.DefaultIngressChain), Context))
	{
		return false;
	}

	if (!InsertIfMissing(PodChain, WPodRuleSpecs::LocalNodeAllow(Pod), Context))
	{
		return false;
	}
	return InsertIfMissing(PodChain, WPodRuleSpecs::StatefulAllow(), Context);
}

bool WPodFirewallSync::SetupPodEgressRules(
	WPodInfo const& Pod, WChainName const& PodChain, WNetworkPolicies const& Policies, WGeneration const& Version)
{
	bool bEgressPoliciesPresent = false;
	if (!InsertPolicyJumps(Pod, PodChain, Policies, Version, bEgressPoliciesPresent))
	{
		return false;
	}

	auto Context = fmt::format("egress rules for pod {}/{}", Pod.Namespace, Pod.Name);
	if (!bEgressPoliciesPresent
		&& !InsertIfMissing(PodChain, WPodRuleSpecs::DefaultEgressJump(Pod, Settings.DefaultEgressChain), Context))
	{
		return false;
	}
	return InsertIfMissing(PodChain, WPodRuleSpecs::StatefulAllow(), Context);
}

bool WPodFirewallSync::InterceptPodInboundTraffic(WPodInfo const& Pod, WChainName const& PodChain)
{
	auto Context = fmt::format("inbound interception for pod {}/{}", Pod.Namespace, Pod.Name);
	auto Jump = WPodRuleSpecs::InboundJump(Pod, PodChain);

	// routed traffic, coming from pods on other nodes
	if (!InsertIfMissing(Settings.ForwardChain, Jump, Context))
	{
		return false;
	}
	// traffic sent back to a pod on this node by the service proxy
	if (!InsertIfMissing(Settings.OutputChain, Jump, Context))
	{
		return false;
	}
	// switched traffic between pods on this node's bridge
	return InsertIfMissing(Settings.ForwardChain, WPodRuleSpecs::InboundBridgedJump(Pod, PodChain), Context);
}

bool WPodFirewallSync::InterceptPodOutboundTraffic(WPodInfo const& Pod, WChainName const& PodChain)
{
	auto Context = fmt::format("outbound interception for pod {}/{}", Pod.Namespace, Pod.Name);
	auto Jump = WPodRuleSpecs::OutboundJump(Pod, PodChain);

	for (auto const& Chain : { Settings.InputChain, Settings.ForwardChain, Settings.OutputChain })
	{
		if (!AppendIfMissing(Chain, Jump, Context))
		{
			return false;
		}
	}
	return InsertIfMissing(Settings.ForwardChain, WPodRuleSpecs::OutboundBridgedJump(Pod, PodChain), Context);
}

bool WPodFirewallSync::DropUnmarkedTrafficRules(WPodInfo const& Pod, WChainName const& PodChain)
{
	auto Context = fmt::format("drop rules for pod {}/{}", Pod.Namespace, Pod.Name);
	if (!AppendIfMissing(PodChain, WPodRuleSpecs::DropLog(Pod, Settings), Context))
	{
		return false;
	}
	return AppendIfMissing(PodChain, WPodRuleSpecs::DropReject(Pod), Context);
}

bool WPodFirewallSync::SetupMarkTail(WPodInfo const& Pod, WChainName const& PodChain)
{
	auto Context = fmt::format("mark rules for pod {}/{}", Pod.Namespace, Pod.Name);
	if (!AppendIfMissing(PodChain, WPodRuleSpecs::MarkReset(), Context))
	{
		return false;
	}
	return AppendIfMissing(PodChain, WPodRuleSpecs::MarkAccept(), Context);
}

bool WPodFirewallSync::SyncPod(WPodInfo const& Pod, WNetworkPolicies const& Policies, WGeneration const& Version)
{
	auto PodChain = WChainNamer::PodFirewallChainName(Pod.Namespace, Pod.Name, Version);

	auto Status = Iptables.NewChain(Settings.Table, PodChain);
	if (!Status.IsOkOrConflict())
	{
		return Fail(fmt::format(
			"pod {}/{}: failed to create chain {}: {}", Pod.Namespace, Pod.Name, PodChain, Status.Describe()));
	}

	spdlog::debug("Syncing chain {} for pod {}/{} ({})", PodChain, Pod.Namespace, Pod.Name, Pod.IP);

	return SetupPodIngressRules(Pod, PodChain, Policies, Version)
		&& SetupPodEgressRules(Pod, PodChain, Policies, Version) && InterceptPodInboundTraffic(Pod, PodChain)
		&& InterceptPodOutboundTraffic(Pod, PodChain) && DropUnmarkedTrafficRules(Pod, PodChain)
		&& SetupMarkTail(Pod, PodChain);
}

std::optional<WActiveChainSet> WPodFirewallSync::SyncPodFirewallChains(
	WNetworkPolicies const& Policies, WGeneration const& Version)
{
	LastError.clear();

	WLocalPods LocalPods{};
	if (!PodResolver.GetLocalPods(NodeIP, LocalPods))
	{
		Fail(fmt::format("failed to resolve pods local to {}", NodeIP));
		return std::nullopt;
	}

	WActiveChainSet ActivePodChains{};
	for (auto const& [Address, Pod] : LocalPods)
	{
		// the chain counts as active even without a policy, the default
		// chain jump and drop rules still apply to it
		ActivePodChains[WChainNamer::PodFirewallChainName(Pod.Namespace, Pod.Name, Version)] = true;

		if (!SyncPod(Pod, Policies, Version))
		{
			return std::nullopt;
		}
	}

	spdlog::debug("Synced {} pod firewall chains for generation {}", ActivePodChains.size(), Version);
	return ActivePodChains;
}
