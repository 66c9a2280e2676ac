/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <vector>

#include "Types.hpp"

enum class EIptablesResult
{
	Success,
	// iptables exit status 1: chain/rule already exists, or the rule/chain to
	// remove does not exist
	Conflict,
	Error
};

struct WIptablesStatus
{
	EIptablesResult Result{ EIptablesResult::Success };
	int             ExitStatus{ 0 };
	std::string     Command{};
	std::string     Output{};

	[[nodiscard]] bool IsOk() const { return Result == EIptablesResult::Success; }
	[[nodiscard]] bool IsConflict() const { return Result == EIptablesResult::Conflict; }

	// Success or an idempotent conflict
	[[nodiscard]] bool IsOkOrConflict() const { return Result != EIptablesResult::Error; }

	[[nodiscard]] std::string Describe() const;

	static WIptablesStatus Ok() { return {}; }
};

/**
 * Narrow view of the packet filter. Every call is synchronous and blocks until
 * the underlying command finished. Implementations must report "already exists"
 * as EIptablesResult::Conflict so callers can tolerate it.
 */
class IIptables
{
public:
	IIptables() = default;
	virtual ~IIptables() = default;

	virtual WIptablesStatus NewChain(std::string const& Table, WChainName const& Chain) = 0;
	virtual WIptablesStatus ClearChain(std::string const& Table, WChainName const& Chain) = 0;
	virtual WIptablesStatus DeleteChain(std::string const& Table, WChainName const& Chain) = 0;
	virtual WIptablesStatus ListChains(std::string const& Table, std::vector<WChainName>& OutChains) = 0;

	// Rules of a chain in append order
	virtual WIptablesStatus List(
		std::string const& Table, WChainName const& Chain, std::vector<WRuleSpec>& OutRules) = 0;

	virtual WIptablesStatus Exists(
		std::string const& Table, WChainName const& Chain, WRuleSpec const& Spec, bool& bOutExists) = 0;

	// Position is 1-based, 1 being the head of the chain
	virtual WIptablesStatus Insert(
		std::string const& Table, WChainName const& Chain, int Position, WRuleSpec const& Spec) = 0;
	virtual WIptablesStatus Append(std::string const& Table, WChainName const& Chain, WRuleSpec const& Spec) = 0;
	virtual WIptablesStatus AppendUnique(
		std::string const& Table, WChainName const& Chain, WRuleSpec const& Spec) = 0;
	virtual WIptablesStatus Delete(std::string const& Table, WChainName const& Chain, WRuleSpec const& Spec) = 0;
};
