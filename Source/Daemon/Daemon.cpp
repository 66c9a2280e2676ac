//
// Created by usr on 19/11/2025.
//

#include "Daemon.hpp"

#include <spdlog/spdlog.h>

#include "DaemonConfig.hpp"
#include "SignalHandler.hpp"

WDaemon::WDaemon()
{
	WDaemonConfig::GetInstance().LogConfig();
}

WDaemon::~WDaemon()
{
	Shutdown();
}

bool WDaemon::InitIptables()
{
	auto const& Config = WDaemonConfig::GetInstance();
	Iptables = std::make_unique<WIptablesCmd>(Config.IptablesPath, Config.bIptablesWait);
	return Iptables->Init();
}

bool WDaemon::InitController()
{
	auto const& Config = WDaemonConfig::GetInstance();

	PolicySource = std::make_unique<WPolicyFileSource>(Config.PoliciesSnapshotPath);
	Controller = std::make_unique<WNetworkPolicyController>(
		*Iptables, PodStore, *PolicySource, Config.Firewall, Config.NodeAddress);
	Scheduler = std::make_unique<WSyncScheduler>(
		[this] { return Controller->FullSync(); }, std::chrono::seconds(Config.SyncPeriodSeconds));
	EventBridge = std::make_unique<WPodEventBridge>([this] { Scheduler->RequestFullSync(); });
	PodSource = std::make_unique<WPodFileSource>(
		Config.PodsSnapshotPath, PodStore, std::chrono::milliseconds(Config.SnapshotPollMillis));

	// fill the cache before the first pass so it doesn't run against an empty node
	if (!PodSource->Poll())
	{
		spdlog::warn("No pod snapshot loaded yet from {}", Config.PodsSnapshotPath);
	}
	return true;
}

void WDaemon::RegisterSignalHandlers()
{
	EventBridge->RegisterSignalHandlers();
}

void WDaemon::RunLoop()
{
	WSignalHandler& SignalHandler = WSignalHandler::GetInstance();

	Scheduler->Start();
	PodSource->Start();

	while (!SignalHandler.bStop)
	{
		if (SignalHandler.bResyncRequested.exchange(false))
		{
			spdlog::info("Received SIGHUP, requesting full sync");
			Scheduler->RequestFullSync();
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(100));
	}
}

void WDaemon::Shutdown()
{
	// sources first so no more requests reach the scheduler
	if (PodSource)
	{
		PodSource->Stop();
	}
	EventBridge.reset();
	if (Scheduler)
	{
		Scheduler->Stop();
	}
}
