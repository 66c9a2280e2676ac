/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "PodItem.hpp"

EPodPhase PodPhaseFromString(std::string const& Phase)
{
	if (Phase == "Pending")
	{
		return EPodPhase::Pending;
	}
	if (Phase == "Running")
	{
		return EPodPhase::Running;
	}
	if (Phase == "Succeeded")
	{
		return EPodPhase::Succeeded;
	}
	if (Phase == "Failed")
	{
		return EPodPhase::Failed;
	}
	return EPodPhase::Unknown;
}

char const* PodPhaseToString(EPodPhase Phase)
{
	switch (Phase)
	{
		case EPodPhase::Pending:
			return "Pending";
		case EPodPhase::Running:
			return "Running";
		case EPodPhase::Succeeded:
			return "Succeeded";
		case EPodPhase::Failed:
			return "Failed";
		default:
			return "Unknown";
	}
}
