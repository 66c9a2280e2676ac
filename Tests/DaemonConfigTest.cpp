/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <unistd.h>

#include "DaemonConfig.hpp"

namespace fs = std::filesystem;

class DaemonConfigTest : public ::testing::Test
{
protected:
	fs::path Path{};

	void SetUp() override
	{
		Path = fs::temp_directory_path() / ("wehr-config-test-" + std::to_string(getpid()) + ".ini");
	}

	void TearDown() override
	{
		std::error_code Ec{};
		fs::remove(Path, Ec);
	}

	void Write(std::string const& Content)
	{
		std::ofstream Out(Path, std::ios::trunc);
		Out << Content;
	}
};

TEST_F(DaemonConfigTest, LoadsAllSections)
{
	Write("[node]\n"
		  "address = 192.168.0.10\n"
		  "[iptables]\n"
		  "path = /usr/sbin/iptables-legacy\n"
		  "wait = false\n"
		  "[firewall]\n"
		  "forward_chain = TEST-FORWARD\n"
		  "nflog_group = 7\n"
		  "log_limit = 5/second\n"
		  "log_limit_burst = 3\n"
		  "[sync]\n"
		  "period_seconds = 60\n"
		  "[sources]\n"
		  "pods = /tmp/pods.json\n"
		  "[daemon]\n"
		  "log_level = debug\n");

	WDaemonConfig Config{};
	ASSERT_TRUE(Config.Load(Path.string()));

	EXPECT_EQ(Config.NodeAddress, "192.168.0.10");
	EXPECT_EQ(Config.IptablesPath, "/usr/sbin/iptables-legacy");
	EXPECT_FALSE(Config.bIptablesWait);
	EXPECT_EQ(Config.Firewall.ForwardChain, "TEST-FORWARD");
	EXPECT_EQ(Config.Firewall.InputChain, "WEHR-INPUT");
	EXPECT_EQ(Config.Firewall.NflogGroup, 7);
	EXPECT_EQ(Config.Firewall.LogLimit, "5/second");
	EXPECT_EQ(Config.Firewall.LogLimitBurst, 3);
	EXPECT_EQ(Config.SyncPeriodSeconds, 60);
	EXPECT_EQ(Config.PodsSnapshotPath, "/tmp/pods.json");
	EXPECT_EQ(Config.PoliciesSnapshotPath, "/var/lib/wehr/policies.json");
	EXPECT_EQ(Config.LogLevel, "debug");
}

TEST_F(DaemonConfigTest, NonPositivePeriodFallsBack)
{
	Write("[sync]\nperiod_seconds = 0\npoll_millis = -5\n");

	WDaemonConfig Config{};
	ASSERT_TRUE(Config.Load(Path.string()));
	EXPECT_EQ(Config.SyncPeriodSeconds, 300);
	EXPECT_EQ(Config.SnapshotPollMillis, 1000);
}

TEST_F(DaemonConfigTest, RejectsBrokenFile)
{
	Write("[node\naddress = 1.2.3.4\n");

	WDaemonConfig Config{};
	EXPECT_FALSE(Config.Load(Path.string()));
	EXPECT_FALSE(Config.Load((Path.string() + ".missing")));
}

TEST_F(DaemonConfigTest, ExplicitAddressIsKept)
{
	WDaemonConfig Config{};
	Config.NodeAddress = "10.0.0.1";
	EXPECT_TRUE(Config.ResolveNodeAddress());
	EXPECT_EQ(Config.NodeAddress, "10.0.0.1");
}
