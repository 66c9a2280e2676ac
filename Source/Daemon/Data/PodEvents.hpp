/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <any>
#include <sigslot/signal.hpp>

#include "Singleton.hpp"
#include "Data/PodItem.hpp"

class WPodEvents final : public TSingleton<WPodEvents>
{
public:
	sigslot::signal<WPodItemPtr const&>                     OnPodAdded;
	sigslot::signal<WPodItemPtr const&, WPodItemPtr const&> OnPodUpdated; // old, new
	// Carries a WPodItemPtr, or a WDeletedFinalStateUnknown when the final
	// state of the pod was missed
	sigslot::signal<std::any const&> OnPodDeleted;
};
