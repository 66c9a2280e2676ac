/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Daemon.hpp"
#include "DaemonConfig.hpp"

#include <cstdlib>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include "SignalHandler.hpp"

int main()
{
	if (std::getenv("INVOCATION_ID") != nullptr)
	{
		// Running under systemd so we don't need the timestamp from spdlog
		spdlog::set_pattern("[%^%l%$] %v");
	}

	if (geteuid() != 0)
	{
		spdlog::critical("Wehr daemon requires root");
		return -1;
	}

	auto& Config = WDaemonConfig::GetInstance();
	spdlog::set_level(spdlog::level::from_str(Config.LogLevel));
	spdlog::info("Wehr daemon starting");

	if (!Config.ResolveNodeAddress())
	{
		return -1;
	}

	// installs the SIGINT/SIGTERM/SIGHUP handlers
	WSignalHandler::GetInstance();

	auto& Daemon = WDaemon::GetInstance();
	if (!Daemon.InitIptables())
	{
		spdlog::critical("Failed to initialize iptables executor");
		return -1;
	}
	if (!Daemon.InitController())
	{
		return -1;
	}

	Daemon.RegisterSignalHandlers();

	spdlog::info("Enforcing network policies for pods on {}", Config.NodeAddress);
	Daemon.RunLoop();
	Daemon.Shutdown();
	spdlog::info("Wehr daemon stopped");
	return 0;
}
