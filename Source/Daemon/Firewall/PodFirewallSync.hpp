/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>

#include "Types.hpp"
#include "FirewallSettings.hpp"
#include "LocalPods.hpp"
#include "Data/NetworkPolicyItem.hpp"

class IIptables;
struct WIptablesStatus;

/**
 * Builds one firewall chain per local pod and wires it into the global chains.
 *
 * For every pod the chain ends up as:
 *   stateful allow, local node allow, jumps to each policy selecting the pod
 *   (or to the default chain), NFLOG + REJECT for packets without the
 *   provisional pass mark, mark reset, mark accept.
 *
 * Every mutation is existence checked so repeated passes with the same
 * generation converge on the same rule set. Passes must not run concurrently,
 * head insertion is order sensitive.
 */
class WPodFirewallSync
{
	IIptables&              Iptables;
	WLocalPodResolver const& PodResolver;
	WFirewallSettings       Settings;
	WPodAddress             NodeIP;

	std::string LastError{};

	bool Fail(std::string Error);
	bool Check(WIptablesStatus const& Status, std::string const& Context);

	bool InsertIfMissing(WChainName const& Chain, WRuleSpec const& Spec, std::string const& Context);
	bool AppendIfMissing(WChainName const& Chain, WRuleSpec const& Spec, std::string const& Context);

	bool SetupPodIngressRules(
		WPodInfo const& Pod, WChainName const& PodChain, WNetworkPolicies const& Policies, WGeneration const& Version);
	bool SetupPodEgressRules(
		WPodInfo const& Pod, WChainName const& PodChain, WNetworkPolicies const& Policies, WGeneration const& Version);
	bool InsertPolicyJumps(
		WPodInfo const& Pod, WChainName const& PodChain, WNetworkPolicies const& Policies, WGeneration const& Version,
		bool& bOutAnyMatched);

	bool InterceptPodInboundTraffic(WPodInfo const& Pod, WChainName const& PodChain);
	bool InterceptPodOutboundTraffic(WPodInfo const& Pod, WChainName const& PodChain);
	bool DropUnmarkedTrafficRules(WPodInfo const& Pod, WChainName const& PodChain);
	bool SetupMarkTail(WPodInfo const& Pod, WChainName const& PodChain);

	bool SyncPod(WPodInfo const& Pod, WNetworkPolicies const& Policies, WGeneration const& Version);

public:
	WPodFirewallSync(
		IIptables& Iptables_, WLocalPodResolver const& PodResolver_, WFirewallSettings Settings_, WPodAddress NodeIP_);

	// Chains used by the local pods for this generation, nullopt if any step
	// failed. GetLastError() describes the failure.
	std::optional<WActiveChainSet> SyncPodFirewallChains(WNetworkPolicies const& Policies, WGeneration const& Version);

	[[nodiscard]] std::string const& GetLastError() const { return LastError; }

	[[nodiscard]] WFirewallSettings const& GetSettings() const { return Settings; }
};
