/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <algorithm>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "Iptables/IIptables.hpp"
#include "Firewall/StaleChainCleanup.hpp"

// In-memory packet filter. Behaves like iptables where the sync depends on it:
// duplicate chains conflict, jumps need an existing target chain and chains
// can only be deleted once empty and unreferenced.
class WFakeIptables final : public IIptables
{
public:
	struct WCall
	{
		std::string Command{};
		WChainName  Chain{};
		WRuleSpec   Spec{};
	};

	std::map<WChainName, std::vector<WRuleSpec>> Chains{};
	std::vector<WCall>                           Calls{};

	// Makes a call fail with exit status 2 when it returns true
	std::function<bool(WCall const&)> FailWhen{};
	// Makes a call exit with status 1 and "No chain/target/match by that name."
	// when it returns true, like iptables without the needed match module
	std::function<bool(WCall const&)> MissingMatchWhen{};

	WFakeIptables()
	{
		for (auto const* Builtin : { "INPUT", "FORWARD", "OUTPUT" })
		{
			Chains[Builtin] = {};
		}
	}

	bool HasChain(WChainName const& Chain) const { return Chains.contains(Chain); }

	std::vector<WRuleSpec> const& Rules(WChainName const& Chain) const
	{
		static std::vector<WRuleSpec> const Empty{};
		auto                                It = Chains.find(Chain);
		return It == Chains.end() ? Empty : It->second;
	}

	size_t CountRule(WChainName const& Chain, WRuleSpec const& Spec) const
	{
		auto const& ChainRules = Rules(Chain);
		return static_cast<size_t>(std::count(ChainRules.begin(), ChainRules.end(), Spec));
	}

	size_t CountJumps(WChainName const& Chain, WChainName const& Target) const
	{
		auto const& ChainRules = Rules(Chain);
		return static_cast<size_t>(std::count_if(ChainRules.begin(), ChainRules.end(),
			[&](WRuleSpec const& Rule) { return WStaleChainCleanup::JumpTarget(Rule) == Target; }));
	}

	size_t CountCalls(std::string const& Command) const
	{
		return static_cast<size_t>(
			std::count_if(Calls.begin(), Calls.end(), [&](WCall const& Call) { return Call.Command == Command; }));
	}

	WIptablesStatus NewChain(std::string const&, WChainName const& Chain) override
	{
		if (auto Status = Record("-N", Chain); !Status.IsOk())
			return Status;
		if (HasChain(Chain))
			return Conflict("-N", Chain, "Chain already exists.");
		Chains[Chain] = {};
		return WIptablesStatus::Ok();
	}

	WIptablesStatus ClearChain(std::string const&, WChainName const& Chain) override
	{
		if (auto Status = Record("-F", Chain); !Status.IsOk())
			return Status;
		if (!HasChain(Chain))
			return Conflict("-F", Chain, "No chain/target/match by that name.");
		Chains[Chain].clear();
		return WIptablesStatus::Ok();
	}

	WIptablesStatus DeleteChain(std::string const&, WChainName const& Chain) override
	{
		if (auto Status = Record("-X", Chain); !Status.IsOk())
			return Status;
		if (!HasChain(Chain))
			return Conflict("-X", Chain, "No chain/target/match by that name.");
		if (!Chains[Chain].empty())
			return Error("-X", Chain, "Directory not empty.");
		for (auto const& [Name, ChainRules] : Chains)
		{
			if (CountJumps(Name, Chain) > 0)
				return Error("-X", Chain, "Too many links.");
		}
		Chains.erase(Chain);
		return WIptablesStatus::Ok();
	}

	WIptablesStatus ListChains(std::string const&, std::vector<WChainName>& OutChains) override
	{
		if (auto Status = Record("-S", {}); !Status.IsOk())
			return Status;
		OutChains.clear();
		for (auto const& [Name, ChainRules] : Chains)
		{
			OutChains.push_back(Name);
		}
		return WIptablesStatus::Ok();
	}

	WIptablesStatus List(std::string const&, WChainName const& Chain, std::vector<WRuleSpec>& OutRules) override
	{
		if (auto Status = Record("-S", Chain); !Status.IsOk())
			return Status;
		if (!HasChain(Chain))
			return Conflict("-S", Chain, "No chain/target/match by that name.");
		OutRules = Chains[Chain];
		return WIptablesStatus::Ok();
	}

	WIptablesStatus Exists(std::string const&, WChainName const& Chain, WRuleSpec const& Spec, bool& bOutExists) override
	{
		if (auto Status = Record("-C", Chain, Spec); !Status.IsOk())
			return Status;
		bOutExists = CountRule(Chain, Spec) > 0;
		return WIptablesStatus::Ok();
	}

	WIptablesStatus Insert(std::string const&, WChainName const& Chain, int Position, WRuleSpec const& Spec) override
	{
		if (auto Status = Record("-I", Chain, Spec); !Status.IsOk())
			return Status;
		if (auto Status = Validate("-I", Chain, Spec); !Status.IsOk())
			return Status;
		auto& ChainRules = Chains[Chain];
		auto  Index = std::clamp<size_t>(static_cast<size_t>(std::max(Position, 1) - 1), 0, ChainRules.size());
		ChainRules.insert(ChainRules.begin() + static_cast<std::ptrdiff_t>(Index), Spec);
		return WIptablesStatus::Ok();
	}

	WIptablesStatus Append(std::string const&, WChainName const& Chain, WRuleSpec const& Spec) override
	{
		if (auto Status = Record("-A", Chain, Spec); !Status.IsOk())
			return Status;
		if (auto Status = Validate("-A", Chain, Spec); !Status.IsOk())
			return Status;
		Chains[Chain].push_back(Spec);
		return WIptablesStatus::Ok();
	}

	WIptablesStatus AppendUnique(std::string const& Table, WChainName const& Chain, WRuleSpec const& Spec) override
	{
		bool bExists = false;
		if (auto Status = Exists(Table, Chain, Spec, bExists); !Status.IsOk())
			return Status;
		if (bExists)
			return WIptablesStatus::Ok();
		return Append(Table, Chain, Spec);
	}

	WIptablesStatus Delete(std::string const&, WChainName const& Chain, WRuleSpec const& Spec) override
	{
		if (auto Status = Record("-D", Chain, Spec); !Status.IsOk())
			return Status;
		auto It = Chains.find(Chain);
		if (It == Chains.end())
			return Conflict("-D", Chain, "No chain/target/match by that name.");
		auto RuleIt = std::find(It->second.begin(), It->second.end(), Spec);
		if (RuleIt == It->second.end())
			return Conflict("-D", Chain, "Bad rule (does a matching rule exist in that chain?).");
		It->second.erase(RuleIt);
		return WIptablesStatus::Ok();
	}

private:
	static bool IsBuiltinTarget(WChainName const& Target)
	{
		static std::set<std::string> const Targets{ "ACCEPT", "DROP", "REJECT", "RETURN", "MARK", "NFLOG", "LOG" };
		return Targets.contains(Target);
	}

	WIptablesStatus Record(std::string const& Command, WChainName const& Chain, WRuleSpec const& Spec = {})
	{
		WCall Call{ Command, Chain, Spec };
		Calls.push_back(Call);
		if (FailWhen && FailWhen(Call))
			return Error(Command, Chain, "injected failure");
		if (MissingMatchWhen && MissingMatchWhen(Call))
			return Conflict(Command, Chain, "No chain/target/match by that name.");
		return WIptablesStatus::Ok();
	}

	WIptablesStatus Validate(std::string const& Command, WChainName const& Chain, WRuleSpec const& Spec) const
	{
		if (!HasChain(Chain))
			return Conflict(Command, Chain, "No chain/target/match by that name.");
		auto Target = WStaleChainCleanup::JumpTarget(Spec);
		if (!Target.empty() && !IsBuiltinTarget(Target) && !HasChain(Target))
			return Error(Command, Chain, "Couldn't load target `" + Target + "'");
		return WIptablesStatus::Ok();
	}

	static WIptablesStatus Conflict(std::string const& Command, WChainName const& Chain, std::string Output)
	{
		return { EIptablesResult::Conflict, 1, "iptables " + Command + " " + Chain, std::move(Output) };
	}

	static WIptablesStatus Error(std::string const& Command, WChainName const& Chain, std::string Output)
	{
		return { EIptablesResult::Error, 2, "iptables " + Command + " " + Chain, std::move(Output) };
	}
};
