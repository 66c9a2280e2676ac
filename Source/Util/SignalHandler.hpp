//
// Created by usr on 09/10/2025.
//

#pragma once

#include <atomic>

#include "Singleton.hpp"

class WSignalHandler : public TSingleton<WSignalHandler>
{
public:
	WSignalHandler();

	std::atomic<bool> bStop{ false };

	// Set on SIGHUP, cleared by whoever turns it into a full sync
	std::atomic<bool> bResyncRequested{ false };
};
