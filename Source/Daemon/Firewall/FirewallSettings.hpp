/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>

#include "Types.hpp"

struct WFirewallSettings
{
	std::string Table{ "filter" };

	// Global chains hooked into INPUT/FORWARD/OUTPUT, pod chains are jumped to from here
	WChainName InputChain{ "WEHR-INPUT" };
	WChainName ForwardChain{ "WEHR-FORWARD" };
	WChainName OutputChain{ "WEHR-OUTPUT" };

	// Used for pods no policy selects in that direction
	WChainName DefaultIngressChain{ "WEHR-DEFAULT-INGRESS" };
	WChainName DefaultEgressChain{ "WEHR-DEFAULT-EGRESS" };

	int         NflogGroup{ 100 };
	std::string LogLimit{ "10/minute" };
	int         LogLimitBurst{ 10 };
};
