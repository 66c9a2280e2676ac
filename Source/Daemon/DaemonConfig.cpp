/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "DaemonConfig.hpp"

#include <INIReader.h>
#include <spdlog/spdlog.h>

#include "Filesystem.hpp"
#include "NetworkInterface.hpp"

WDaemonConfig::WDaemonConfig()
{
	SetDefaults();
	if (WFilesystem::Exists("./wehrd.ini"))
	{
		Load("./wehrd.ini");
	}
	else if (WFilesystem::Exists("/etc/wehr/wehrd.ini"))
	{
		Load("/etc/wehr/wehrd.ini");
	}
	else
	{
		spdlog::info("no configuration file found, using defaults");
	}
}

void WDaemonConfig::LogConfig()
{
	spdlog::info("node address={} (interface={})", NodeAddress, NodeInterfaceName);
	spdlog::info("iptables={} table={}", IptablesPath, Firewall.Table);
	spdlog::info("pods snapshot={}", PodsSnapshotPath);
	spdlog::info("policies snapshot={}", PoliciesSnapshotPath);
	spdlog::info("sync period={}s", SyncPeriodSeconds);
}

bool WDaemonConfig::Load(std::string const& Path)
{
	INIReader Reader(Path);

	auto SafeGet = [&](std::string const& Section, std::string const& Name, std::string& OutVal) {
		if (Reader.HasValue(Section, Name))
		{
			OutVal = Reader.Get(Section, Name, OutVal);
		}
	};

	if (Reader.ParseError() < 0)
	{
		spdlog::error("can't load '{}': {}", Path, Reader.ParseErrorMessage());
		return false;
	}
	if (Reader.ParseError() > 0)
	{
		spdlog::error("can't load '{}': parse error on line {}", Path, Reader.ParseError());
		return false;
	}

	SafeGet("node", "address", NodeAddress);
	SafeGet("node", "interface", NodeInterfaceName);

	SafeGet("iptables", "path", IptablesPath);
	bIptablesWait = Reader.GetBoolean("iptables", "wait", bIptablesWait);
	SafeGet("iptables", "table", Firewall.Table);

	SafeGet("firewall", "input_chain", Firewall.InputChain);
	SafeGet("firewall", "forward_chain", Firewall.ForwardChain);
	SafeGet("firewall", "output_chain", Firewall.OutputChain);
	SafeGet("firewall", "default_ingress_chain", Firewall.DefaultIngressChain);
	SafeGet("firewall", "default_egress_chain", Firewall.DefaultEgressChain);
	Firewall.NflogGroup = static_cast<int>(Reader.GetInteger("firewall", "nflog_group", Firewall.NflogGroup));
	SafeGet("firewall", "log_limit", Firewall.LogLimit);
	Firewall.LogLimitBurst =
		static_cast<int>(Reader.GetInteger("firewall", "log_limit_burst", Firewall.LogLimitBurst));

	SyncPeriodSeconds = static_cast<int>(Reader.GetInteger("sync", "period_seconds", SyncPeriodSeconds));
	SnapshotPollMillis = static_cast<int>(Reader.GetInteger("sync", "poll_millis", SnapshotPollMillis));
	if (SyncPeriodSeconds <= 0)
	{
		spdlog::warn("sync.period_seconds must be positive, using 300");
		SyncPeriodSeconds = 300;
	}
	if (SnapshotPollMillis <= 0)
	{
		spdlog::warn("sync.poll_millis must be positive, using 1000");
		SnapshotPollMillis = 1000;
	}

	SafeGet("sources", "pods", PodsSnapshotPath);
	SafeGet("sources", "policies", PoliciesSnapshotPath);

	SafeGet("daemon", "log_level", LogLevel);
	return true;
}

void WDaemonConfig::SetDefaults()
{
	auto Ifaces = WNetworkInterface::list();
	for (auto const& Iface : Ifaces)
	{
		if (Iface != "lo")
		{
			NodeInterfaceName = Iface;
			break;
		}
	}
	if (NodeInterfaceName.empty())
	{
		NodeInterfaceName = "eth0";
	}
}

bool WDaemonConfig::ResolveNodeAddress()
{
	if (NodeAddress != "auto" && !NodeAddress.empty())
	{
		return true;
	}

	NodeAddress = WNetworkInterface::GetIPv4Address(NodeInterfaceName);
	if (NodeAddress.empty())
	{
		spdlog::critical("Could not determine the node address from interface {}", NodeInterfaceName);
		return false;
	}
	spdlog::info("Detected node address {} on {}", NodeAddress, NodeInterfaceName);
	return true;
}
