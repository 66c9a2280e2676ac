/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>

#include "FirewallSettings.hpp"

class IIptables;

/**
 * Chains every pod chain depends on:
 *  - WEHR-INPUT/FORWARD/OUTPUT, jumped to from the built-in chains
 *  - the default ingress/egress chains, which mark everything as permitted
 */
class WTopLevelChains
{
	IIptables&        Iptables;
	WFirewallSettings Settings;

	bool EnsureChain(WChainName const& Chain);
	bool EnsureHook(std::string const& BuiltinChain, WChainName const& Chain);

public:
	WTopLevelChains(IIptables& Iptables_, WFirewallSettings Settings_);

	bool Ensure();

	// Makes the final rule of each global chain ACCEPT packets carrying the
	// final pass mark. Runs after the pod chains were wired in.
	bool EnsureExplicitAccept();
};
