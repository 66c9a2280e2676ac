/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <any>
#include <functional>
#include <sigslot/signal.hpp>

#include "Data/PodItem.hpp"

/**
 * Turns pod lifecycle notifications into full sync requests. No pod state is
 * kept here, the sync recomputes everything from the pod cache.
 */
class WPodEventBridge
{
	std::function<void()> RequestFullSync;

	sigslot::scoped_connection AddConnection;
	sigslot::scoped_connection UpdateConnection;
	sigslot::scoped_connection DeleteConnection;

public:
	explicit WPodEventBridge(std::function<void()> RequestFullSync_);

	// Subscribes to WPodEvents. Disconnected again when the bridge is destroyed.
	void RegisterSignalHandlers();

	void OnPodAdd(WPodItemPtr const& Pod);
	// Only phase and address changes matter for the firewall
	void OnPodUpdate(WPodItemPtr const& OldPod, WPodItemPtr const& NewPod);
	void OnPodDelete(std::any const& Obj);
};
