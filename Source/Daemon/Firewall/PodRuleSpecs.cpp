/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "PodRuleSpecs.hpp"

#include <spdlog/fmt/fmt.h>

#include "FirewallSettings.hpp"

std::string WPodRuleSpecs::FormatMark(uint32_t Value, uint32_t Mask)
{
	return fmt::format("{:#x}/{:#x}", Value, Mask);
}

WRuleSpec WPodRuleSpecs::PolicyJump(std::string const& PolicyName, WChainName const& PolicyChain)
{
	return { "-m", "comment", "--comment", "run through nw policy " + PolicyName, "-j", PolicyChain };
}

WRuleSpec WPodRuleSpecs::DefaultIngressJump(WPodInfo const& Pod, WChainName const& DefaultChain)
{
	return { "-d", Pod.IP, "-m", "comment", "--comment", "run through default ingress policy chain", "-j",
		DefaultChain };
}

WRuleSpec WPodRuleSpecs::DefaultEgressJump(WPodInfo const& Pod, WChainName const& DefaultChain)
{
	return { "-s", Pod.IP, "-m", "comment", "--comment", "run through default egress policy chain", "-j",
		DefaultChain };
}

WRuleSpec WPodRuleSpecs::LocalNodeAllow(WPodInfo const& Pod)
{
	return { "-m", "comment", "--comment", "rule to permit the traffic to pods when source is the pod's local node",
		"-m", "addrtype", "--src-type", "LOCAL", "-d", Pod.IP, "-j", "ACCEPT" };
}

WRuleSpec WPodRuleSpecs::StatefulAllow()
{
	return { "-m", "comment", "--comment", "rule for stateful firewall for pod", "-m", "conntrack", "--ctstate",
		"RELATED,ESTABLISHED", "-j", "ACCEPT" };
}

WRuleSpec WPodRuleSpecs::InboundJump(WPodInfo const& Pod, WChainName const& PodChain)
{
	auto Comment = fmt::format(
		"rule to jump traffic destined to POD name:{} namespace: {} to chain {}", Pod.Name, Pod.Namespace, PodChain);
	return { "-m", "comment", "--comment", Comment, "-d", Pod.IP, "-j", PodChain };
}

WRuleSpec WPodRuleSpecs::InboundBridgedJump(WPodInfo const& Pod, WChainName const& PodChain)
{
	auto Comment = fmt::format(
		"rule to jump traffic destined to POD name:{} namespace: {} to chain {}", Pod.Name, Pod.Namespace, PodChain);
	return { "-m", "physdev", "--physdev-is-bridged", "-m", "comment", "--comment", Comment, "-d", Pod.IP, "-j",
		PodChain };
}

WRuleSpec WPodRuleSpecs::OutboundJump(WPodInfo const& Pod, WChainName const& PodChain)
{
	auto Comment = fmt::format(
		"rule to jump traffic from POD name:{} namespace: {} to chain {}", Pod.Name, Pod.Namespace, PodChain);
	return { "-m", "comment", "--comment", Comment, "-s", Pod.IP, "-j", PodChain };
}

WRuleSpec WPodRuleSpecs::OutboundBridgedJump(WPodInfo const& Pod, WChainName const& PodChain)
{
	auto Comment = fmt::format(
		"rule to jump traffic from POD name:{} namespace: {} to chain {}", Pod.Name, Pod.Namespace, PodChain);
	return { "-m", "physdev", "--physdev-is-bridged", "-m", "comment", "--comment", Comment, "-s", Pod.IP, "-j",
		PodChain };
}

WRuleSpec WPodRuleSpecs::DropLog(WPodInfo const& Pod, WFirewallSettings const& Settings)
{
	auto Comment = fmt::format("rule to log dropped traffic POD name:{} namespace: {}", Pod.Name, Pod.Namespace);
	auto Mark = FormatMark(EFirewallMark::ProvisionalPass, EFirewallMark::ProvisionalPass);
	return { "-m", "comment", "--comment", Comment, "-m", "mark", "!", "--mark", Mark, "-j", "NFLOG",
		"--nflog-group", std::to_string(Settings.NflogGroup), "-m", "limit", "--limit", Settings.LogLimit,
		"--limit-burst", std::to_string(Settings.LogLimitBurst) };
}

WRuleSpec WPodRuleSpecs::DropReject(WPodInfo const& Pod)
{
	auto Comment =
		fmt::format("rule to REJECT traffic destined for POD name:{} namespace: {}", Pod.Name, Pod.Namespace);
	auto Mark = FormatMark(EFirewallMark::ProvisionalPass, EFirewallMark::ProvisionalPass);
	return { "-m", "comment", "--comment", Comment, "-m", "mark", "!", "--mark", Mark, "-j", "REJECT" };
}

WRuleSpec WPodRuleSpecs::MarkReset()
{
	// clear the provisional bit so a second pod chain on the same path (pod to
	// pod on this node) evaluates its own policies from scratch
	return { "-j", "MARK", "--set-mark", FormatMark(0, EFirewallMark::ProvisionalPass) };
}

WRuleSpec WPodRuleSpecs::MarkAccept()
{
	return { "-m", "comment", "--comment", "set mark to ACCEPT traffic that comply to network policies", "-j",
		"MARK", "--set-mark", FormatMark(EFirewallMark::FinalPass, EFirewallMark::FinalPass) };
}
