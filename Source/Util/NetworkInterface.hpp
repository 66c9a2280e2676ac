/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <vector>

class WNetworkInterface
{
public:
	// Returns a list of all network interface names present on the system.
	// The list is de-duplicated and not guaranteed to be sorted.
	static std::vector<std::string> list();

	// First IPv4 address assigned to the interface, empty if there is none
	static std::string GetIPv4Address(std::string const& Ifname);
};
