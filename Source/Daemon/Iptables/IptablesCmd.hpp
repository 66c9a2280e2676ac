/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <vector>

#include "IIptables.hpp"

// IIptables backed by the iptables binary
class WIptablesCmd final : public IIptables
{
	std::string IptablesPath{};
	bool        bWait{ true };

	WIptablesStatus Run(std::vector<std::string> const& Args, std::string* OutStdout = nullptr) const;

	std::vector<std::string> MakeArgs(
		std::string const& Table, char const* Command, WChainName const& Chain, WRuleSpec const& Spec = {}) const;

public:
	explicit WIptablesCmd(std::string IptablesPath_, bool bWait_ = true);

	// Checks the binary can be executed. Failing this is fatal for the daemon.
	bool Init();

	WIptablesStatus NewChain(std::string const& Table, WChainName const& Chain) override;
	WIptablesStatus ClearChain(std::string const& Table, WChainName const& Chain) override;
	WIptablesStatus DeleteChain(std::string const& Table, WChainName const& Chain) override;
	WIptablesStatus ListChains(std::string const& Table, std::vector<WChainName>& OutChains) override;
	WIptablesStatus List(std::string const& Table, WChainName const& Chain, std::vector<WRuleSpec>& OutRules) override;
	WIptablesStatus Exists(
		std::string const& Table, WChainName const& Chain, WRuleSpec const& Spec, bool& bOutExists) override;
	WIptablesStatus Insert(
		std::string const& Table, WChainName const& Chain, int Position, WRuleSpec const& Spec) override;
	WIptablesStatus Append(std::string const& Table, WChainName const& Chain, WRuleSpec const& Spec) override;
	WIptablesStatus AppendUnique(std::string const& Table, WChainName const& Chain, WRuleSpec const& Spec) override;
	WIptablesStatus Delete(std::string const& Table, WChainName const& Chain, WRuleSpec const& Spec) override;

	// Splits one line of `iptables -S` output into arguments, honouring double quotes
	static std::vector<std::string> SplitRuleLine(std::string const& Line);
};
