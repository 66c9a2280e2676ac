/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "PodEventBridge.hpp"

#include <spdlog/spdlog.h>

#include "PodEvents.hpp"

WPodEventBridge::WPodEventBridge(std::function<void()> RequestFullSync_)
	: RequestFullSync(std::move(RequestFullSync_))
{
}

void WPodEventBridge::RegisterSignalHandlers()
{
	auto& Events = WPodEvents::GetInstance();
	AddConnection = Events.OnPodAdded.connect(std::bind(&WPodEventBridge::OnPodAdd, this, std::placeholders::_1));
	UpdateConnection = Events.OnPodUpdated.connect(
		std::bind(&WPodEventBridge::OnPodUpdate, this, std::placeholders::_1, std::placeholders::_2));
	DeleteConnection =
		Events.OnPodDeleted.connect(std::bind(&WPodEventBridge::OnPodDelete, this, std::placeholders::_1));
}

void WPodEventBridge::OnPodAdd(WPodItemPtr const& Pod)
{
	if (!Pod)
	{
		return;
	}
	spdlog::debug("Received pod: {}/{} add event", Pod->Namespace, Pod->Name);
	RequestFullSync();
}

void WPodEventBridge::OnPodUpdate(WPodItemPtr const& OldPod, WPodItemPtr const& NewPod)
{
	if (!OldPod || !NewPod)
	{
		return;
	}
	if (NewPod->Status.Phase == OldPod->Status.Phase && NewPod->Status.PodIP == OldPod->Status.PodIP)
	{
		return;
	}
	spdlog::debug("Received pod: {}/{} update event ({} -> {}, '{}' -> '{}')", NewPod->Namespace, NewPod->Name,
		PodPhaseToString(OldPod->Status.Phase), PodPhaseToString(NewPod->Status.Phase), OldPod->Status.PodIP,
		NewPod->Status.PodIP);
	RequestFullSync();
}

void WPodEventBridge::OnPodDelete(std::any const& Obj)
{
	WPodItemPtr Pod{};
	if (auto const* Direct = std::any_cast<WPodItemPtr>(&Obj))
	{
		Pod = *Direct;
	}
	else if (auto const* Tombstone = std::any_cast<WDeletedFinalStateUnknown>(&Obj))
	{
		if (auto const* Inner = std::any_cast<WPodItemPtr>(&Tombstone->Obj))
		{
			Pod = *Inner;
		}
		else
		{
			spdlog::error("Unexpected object type in tombstone {}: {}", Tombstone->Key, Tombstone->Obj.type().name());
			return;
		}
	}

	if (!Pod)
	{
		spdlog::error("Unexpected object type: {}", Obj.has_value() ? Obj.type().name() : "empty");
		return;
	}
	spdlog::debug("Received pod: {}/{} delete event", Pod->Namespace, Pod->Name);
	RequestFullSync();
}
