/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <memory>

#include "Singleton.hpp"
#include "Iptables/IptablesCmd.hpp"
#include "Data/PodStore.hpp"
#include "Data/PodEventBridge.hpp"
#include "Data/SnapshotFiles.hpp"
#include "Firewall/NetworkPolicyController.hpp"
#include "Sync/SyncScheduler.hpp"

class WDaemon : public TSingleton<WDaemon>
{
	std::unique_ptr<WIptablesCmd>             Iptables{};
	WPodStore                                 PodStore{};
	std::unique_ptr<WPodFileSource>           PodSource{};
	std::unique_ptr<WPolicyFileSource>        PolicySource{};
	std::unique_ptr<WNetworkPolicyController> Controller{};
	std::unique_ptr<WSyncScheduler>           Scheduler{};
	std::unique_ptr<WPodEventBridge>          EventBridge{};

public:
	WDaemon();
	~WDaemon() override;

	bool InitIptables();
	bool InitController();
	void RegisterSignalHandlers();

	void RunLoop();
	void Shutdown();
};
