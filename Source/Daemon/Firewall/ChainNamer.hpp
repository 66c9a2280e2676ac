/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>

#include "Types.hpp"

/**
 * Chain names are content addressed: a role prefix followed by the first 16
 * base32 characters of SHA-256(namespace + identity + generation). With the
 * 12 character prefixes every name is exactly 28 characters long, the longest
 * name iptables accepts. Each generation yields a fresh set of names so new
 * chains can be wired in before the previous generation is removed.
 */
class WChainNamer
{
public:
	static constexpr char const* PodFirewallChainPrefix = "WEHR-POD-FW-";
	static constexpr char const* NetworkPolicyChainPrefix = "WEHR-NWPLCY-";
	static constexpr size_t      DigestLength = 16;

	static WChainName PodFirewallChainName(
		std::string const& Namespace, std::string const& PodName, WGeneration const& Version);

	static WChainName NetworkPolicyChainName(
		std::string const& Namespace, std::string const& PolicyName, WGeneration const& Version);

	static bool IsPodFirewallChain(WChainName const& Chain);
	static bool IsNetworkPolicyChain(WChainName const& Chain);

private:
	static WChainName MakeName(char const* Prefix, std::string const& Namespace, std::string const& Identity,
		WGeneration const& Version);
};
