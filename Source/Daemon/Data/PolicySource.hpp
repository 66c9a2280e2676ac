/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include "Data/NetworkPolicyItem.hpp"

// Resolved network policies, selectors already evaluated
class IPolicySource
{
public:
	IPolicySource() = default;
	virtual ~IPolicySource() = default;

	virtual bool GetPolicies(WNetworkPolicies& OutPolicies) = 0;
};
