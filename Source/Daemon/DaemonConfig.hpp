/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>

#include "Singleton.hpp"
#include "Firewall/FirewallSettings.hpp"

struct WDaemonConfig final : TSingleton<WDaemonConfig>
{
	std::string NodeAddress{ "auto" }; // pods whose hostIP matches are enforced here
	std::string NodeInterfaceName{};   // used to detect NodeAddress
	std::string IptablesPath{ "iptables" };
	bool        bIptablesWait{ true };
	std::string PodsSnapshotPath{ "/var/lib/wehr/pods.json" };
	std::string PoliciesSnapshotPath{ "/var/lib/wehr/policies.json" };
	int         SyncPeriodSeconds{ 300 };
	int         SnapshotPollMillis{ 1000 };
	std::string LogLevel{ "info" };

	WFirewallSettings Firewall{};

	WDaemonConfig();

	void LogConfig();

	// Loads Path over the current values, false if it can't be parsed
	bool Load(std::string const& Path);

	// Resolves NodeAddress "auto", false if no address could be found
	bool ResolveNodeAddress();

private:
	void SetDefaults();
};
