/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ChainNamer.hpp"

#include "Hash.hpp"

WChainName WChainNamer::MakeName(
	char const* Prefix, std::string const& Namespace, std::string const& Identity, WGeneration const& Version)
{
	auto const Digest = WHash::Sha256(Namespace + Identity + Version);
	return std::string(Prefix) + WHash::Base32(Digest).substr(0, DigestLength);
}

WChainName WChainNamer::PodFirewallChainName(
	std::string const& Namespace, std::string const& PodName, WGeneration const& Version)
{
	return MakeName(PodFirewallChainPrefix, Namespace, PodName, Version);
}

WChainName WChainNamer::NetworkPolicyChainName(
	std::string const& Namespace, std::string const& PolicyName, WGeneration const& Version)
{
	return MakeName(NetworkPolicyChainPrefix, Namespace, PolicyName, Version);
}

bool WChainNamer::IsPodFirewallChain(WChainName const& Chain)
{
	return Chain.starts_with(PodFirewallChainPrefix);
}

bool WChainNamer::IsNetworkPolicyChain(WChainName const& Chain)
{
	return Chain.starts_with(NetworkPolicyChainPrefix);
}
