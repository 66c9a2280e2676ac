/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "IptablesCmd.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <array>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

#include "ErrnoUtil.hpp"

std::string WIptablesStatus::Describe() const
{
	if (Result == EIptablesResult::Success)
	{
		return "ok";
	}
	return fmt::format("'{}' failed with exit status {}: {}", Command, ExitStatus, Output);
}

WIptablesCmd::WIptablesCmd(std::string IptablesPath_, bool bWait_)
	: IptablesPath(std::move(IptablesPath_)), bWait(bWait_)
{
}

bool WIptablesCmd::Init()
{
	std::string Version{};
	auto        Status = Run({ "--version" }, &Version);
	if (!Status.IsOk())
	{
		spdlog::critical("Failed to initialize iptables executor: {}", Status.Describe());
		return false;
	}
	while (!Version.empty() && Version.back() == '\n')
	{
		Version.pop_back();
	}
	spdlog::info("Using {} ({})", IptablesPath, Version);
	return true;
}

WIptablesStatus WIptablesCmd::Run(std::vector<std::string> const& Args, std::string* OutStdout) const
{
	WIptablesStatus Status{};
	Status.Command = fmt::format("{} {}", IptablesPath, fmt::join(Args, " "));

	int OutPipe[2]{ -1, -1 };
	int ErrPipe[2]{ -1, -1 };
	if (pipe2(OutPipe, O_CLOEXEC) != 0 || pipe2(ErrPipe, O_CLOEXEC) != 0)
	{
		Status.Result = EIptablesResult::Error;
		Status.ExitStatus = -1;
		Status.Output = fmt::format("pipe failed: {}", WErrnoUtil::StrError());
		for (int Fd : { OutPipe[0], OutPipe[1], ErrPipe[0], ErrPipe[1] })
		{
			if (Fd >= 0)
				close(Fd);
		}
		return Status;
	}

	// argv must be set up before forking
	std::vector<char*> Argv{};
	Argv.reserve(Args.size() + 2);
	Argv.push_back(const_cast<char*>(IptablesPath.c_str()));
	for (auto const& Arg : Args)
	{
		Argv.push_back(const_cast<char*>(Arg.c_str()));
	}
	Argv.push_back(nullptr);

	pid_t Pid = fork();
	if (Pid == 0)
	{
		// within forked child
		if (dup2(OutPipe[1], STDOUT_FILENO) != STDOUT_FILENO || dup2(ErrPipe[1], STDERR_FILENO) != STDERR_FILENO)
			_exit(127);

		execvp(IptablesPath.c_str(), Argv.data());
		_exit(127);
	}

	close(OutPipe[1]);
	close(ErrPipe[1]);

	if (Pid < 0)
	{
		close(OutPipe[0]);
		close(ErrPipe[0]);
		Status.Result = EIptablesResult::Error;
		Status.ExitStatus = -1;
		Status.Output = fmt::format("fork failed: {}", WErrnoUtil::StrError());
		return Status;
	}

	std::string            StdOut{};
	std::string            StdErr{};
	std::array<pollfd, 2>  Fds{ pollfd{ OutPipe[0], POLLIN, 0 }, pollfd{ ErrPipe[0], POLLIN, 0 } };
	std::array<char, 4096> Buffer{};
	int                    Open = 2;
	while (Open > 0)
	{
		if (poll(Fds.data(), Fds.size(), -1) < 0)
		{
			if (errno == EINTR)
				continue;
			spdlog::error("poll on iptables output failed: {}", WErrnoUtil::StrError());
			break;
		}
		for (size_t i = 0; i < Fds.size(); ++i)
		{
			if (Fds[i].fd < 0 || Fds[i].revents == 0)
				continue;

			ssize_t N = read(Fds[i].fd, Buffer.data(), Buffer.size());
			if (N > 0)
			{
				(i == 0 ? StdOut : StdErr).append(Buffer.data(), static_cast<size_t>(N));
			}
			else if (N == 0 || errno != EINTR)
			{
				close(Fds[i].fd);
				Fds[i].fd = -1;
				--Open;
			}
		}
	}
	for (auto const& Fd : Fds)
	{
		if (Fd.fd >= 0)
			close(Fd.fd);
	}

	int WaitStatus = 0;
	while (waitpid(Pid, &WaitStatus, 0) < 0)
	{
		if (errno != EINTR)
		{
			Status.Result = EIptablesResult::Error;
			Status.ExitStatus = -1;
			Status.Output = fmt::format("waitpid failed: {}", WErrnoUtil::StrError());
			return Status;
		}
	}

	Status.ExitStatus = WIFEXITED(WaitStatus) ? WEXITSTATUS(WaitStatus) : -1;
	while (!StdErr.empty() && StdErr.back() == '\n')
	{
		StdErr.pop_back();
	}
	Status.Output = std::move(StdErr);

	if (Status.ExitStatus == 0)
	{
		Status.Result = EIptablesResult::Success;
	}
	else if (Status.ExitStatus == 1)
	{
		Status.Result = EIptablesResult::Conflict;
	}
	else
	{
		Status.Result = EIptablesResult::Error;
	}

	if (OutStdout)
	{
		*OutStdout = std::move(StdOut);
	}
	return Status;
}

std::vector<std::string> WIptablesCmd::MakeArgs(
	std::string const& Table, char const* Command, WChainName const& Chain, WRuleSpec const& Spec) const
{
	std::vector<std::string> Args{};
	Args.reserve(Spec.size() + 5);
	if (bWait)
	{
		Args.emplace_back("--wait");
	}
	Args.emplace_back("-t");
	Args.push_back(Table);
	Args.emplace_back(Command);
	Args.push_back(Chain);
	Args.insert(Args.end(), Spec.begin(), Spec.end());
	return Args;
}

WIptablesStatus WIptablesCmd::NewChain(std::string const& Table, WChainName const& Chain)
{
	return Run(MakeArgs(Table, "-N", Chain));
}

WIptablesStatus WIptablesCmd::ClearChain(std::string const& Table, WChainName const& Chain)
{
	return Run(MakeArgs(Table, "-F", Chain));
}

WIptablesStatus WIptablesCmd::DeleteChain(std::string const& Table, WChainName const& Chain)
{
	return Run(MakeArgs(Table, "-X", Chain));
}

WIptablesStatus WIptablesCmd::ListChains(std::string const& Table, std::vector<WChainName>& OutChains)
{
	std::vector<std::string> Args{};
	if (bWait)
	{
		Args.emplace_back("--wait");
	}
	Args.insert(Args.end(), { "-t", Table, "-S" });

	std::string Output{};
	auto        Status = Run(Args, &Output);
	if (!Status.IsOk())
	{
		return Status;
	}

	// "-P INPUT ACCEPT" for built-in chains, "-N NAME" for user chains
	OutChains.clear();
	std::istringstream Lines(Output);
	std::string        Line{};
	while (std::getline(Lines, Line))
	{
		auto Parts = SplitRuleLine(Line);
		if (Parts.size() >= 2 && (Parts[0] == "-P" || Parts[0] == "-N"))
		{
			OutChains.push_back(Parts[1]);
		}
	}
	return Status;
}

WIptablesStatus WIptablesCmd::List(std::string const& Table, WChainName const& Chain, std::vector<WRuleSpec>& OutRules)
{
	std::string Output{};
	auto        Status = Run(MakeArgs(Table, "-S", Chain), &Output);
	if (!Status.IsOk())
	{
		return Status;
	}

	OutRules.clear();
	std::istringstream Lines(Output);
	std::string        Line{};
	while (std::getline(Lines, Line))
	{
		auto Parts = SplitRuleLine(Line);
		// skip "-N chain" / "-P chain policy", keep the rule after "-A chain"
		if (Parts.size() > 2 && Parts[0] == "-A")
		{
			OutRules.emplace_back(Parts.begin() + 2, Parts.end());
		}
	}
	return Status;
}

WIptablesStatus WIptablesCmd::Exists(
	std::string const& Table, WChainName const& Chain, WRuleSpec const& Spec, bool& bOutExists)
{
	auto Status = Run(MakeArgs(Table, "-C", Chain, Spec));
	if (Status.IsOk())
	{
		bOutExists = true;
		return Status;
	}
	if (Status.IsConflict())
	{
		// exit status 1 means the rule is not in the chain, but -C also exits
		// with 1 when the chain or a match/target module is missing. The
		// following -I/-A reports those.
		bOutExists = false;
		return WIptablesStatus::Ok();
	}
	return Status;
}

WIptablesStatus WIptablesCmd::Insert(
	std::string const& Table, WChainName const& Chain, int Position, WRuleSpec const& Spec)
{
	WRuleSpec Args{ std::to_string(Position) };
	Args.insert(Args.end(), Spec.begin(), Spec.end());
	return Run(MakeArgs(Table, "-I", Chain, Args));
}

WIptablesStatus WIptablesCmd::Append(std::string const& Table, WChainName const& Chain, WRuleSpec const& Spec)
{
	return Run(MakeArgs(Table, "-A", Chain, Spec));
}

WIptablesStatus WIptablesCmd::AppendUnique(std::string const& Table, WChainName const& Chain, WRuleSpec const& Spec)
{
	bool bExists = false;
	if (auto Status = Exists(Table, Chain, Spec, bExists); !Status.IsOk())
	{
		return Status;
	}
	if (bExists)
	{
		return WIptablesStatus::Ok();
	}
	return Append(Table, Chain, Spec);
}

WIptablesStatus WIptablesCmd::Delete(std::string const& Table, WChainName const& Chain, WRuleSpec const& Spec)
{
	return Run(MakeArgs(Table, "-D", Chain, Spec));
}

std::vector<std::string> WIptablesCmd::SplitRuleLine(std::string const& Line)
{
	std::vector<std::string> Parts{};
	std::string              Current{};
	bool                     bInQuotes = false;
	bool                     bHasToken = false;

	for (size_t i = 0; i < Line.size(); ++i)
	{
		char C = Line[i];
		if (C == '\\' && bInQuotes && i + 1 < Line.size())
		{
			Current.push_back(Line[++i]);
		}
		else if (C == '"')
		{
			bInQuotes = !bInQuotes;
			bHasToken = true;
		}
		else if ((C == ' ' || C == '\t' || C == '\r') && !bInQuotes)
		{
			if (bHasToken)
			{
				Parts.emplace_back(std::move(Current));
				Current.clear();
				bHasToken = false;
			}
		}
		else
		{
			Current.push_back(C);
			bHasToken = true;
		}
	}
	if (bHasToken)
	{
		Parts.emplace_back(std::move(Current));
	}
	return Parts;
}
