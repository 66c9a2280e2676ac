/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <unistd.h>

#include "Data/PodStore.hpp"
#include "Data/SnapshotFiles.hpp"

namespace fs = std::filesystem;

TEST(SnapshotParser, ParsesPods)
{
	auto const Json = R"({ "pods": [
		{ "name": "web-0", "namespace": "default", "labels": { "app": "web" },
		  "phase": "Running", "podIP": "10.1.1.5", "hostIP": "192.168.0.10" },
		{ "name": "pending", "namespace": "default", "phase": "Pending", "hostIP": "192.168.0.10" },
		{ "namespace": "broken" }
	] })";

	std::vector<WPodItem> Pods{};
	std::string           Error{};
	ASSERT_TRUE(WSnapshotParser::ParsePods(Json, Pods, Error)) << Error;

	ASSERT_EQ(Pods.size(), 2u);
	EXPECT_EQ(Pods[0].GetKey(), "default/web-0");
	EXPECT_EQ(Pods[0].Labels.at("app"), "web");
	EXPECT_EQ(Pods[0].Status.Phase, EPodPhase::Running);
	EXPECT_EQ(Pods[0].Status.PodIP, "10.1.1.5");
	EXPECT_EQ(Pods[0].Status.HostIP, "192.168.0.10");
	EXPECT_EQ(Pods[1].Status.Phase, EPodPhase::Pending);
	EXPECT_TRUE(Pods[1].Status.PodIP.empty());
}

TEST(SnapshotParser, RejectsMalformedPods)
{
	std::vector<WPodItem> Pods{};
	std::string           Error{};
	EXPECT_FALSE(WSnapshotParser::ParsePods("{ \"pods\": [", Pods, Error));
	EXPECT_FALSE(Error.empty());

	Error.clear();
	EXPECT_FALSE(WSnapshotParser::ParsePods("{ \"items\": [] }", Pods, Error));
	EXPECT_EQ(Error, "missing 'pods' array");
}

TEST(SnapshotParser, ParsesPolicies)
{
	auto const Json = R"({ "policies": [
		{ "name": "allow-web", "namespace": "default", "targetPods": [ "10.1.1.5", "10.1.1.6", "" ],
		  "rules": [ [ "-s", "10.1.1.100", "-j", "MARK", "--set-mark", "0x10000/0x10000" ], [] ] },
		{ "name": "deny-all", "namespace": "prod" }
	] })";

	WNetworkPolicies Policies{};
	std::string      Error{};
	ASSERT_TRUE(WSnapshotParser::ParsePolicies(Json, Policies, Error)) << Error;

	ASSERT_EQ(Policies.size(), 2u);
	EXPECT_EQ(Policies[0].Name, "allow-web");
	EXPECT_EQ(Policies[0].TargetPods.size(), 2u);
	EXPECT_TRUE(Policies[0].Targets("10.1.1.6"));
	ASSERT_EQ(Policies[0].ChainRules.size(), 1u);
	EXPECT_EQ(Policies[0].ChainRules[0].back(), "0x10000/0x10000");
	EXPECT_TRUE(Policies[1].TargetPods.empty());
	EXPECT_TRUE(Policies[1].ChainRules.empty());
}

class SnapshotFileTest : public ::testing::Test
{
protected:
	fs::path Dir{};

	void SetUp() override
	{
		Dir = fs::temp_directory_path() / ("wehr-snapshot-test-" + std::to_string(getpid()));
		fs::create_directories(Dir);
	}

	void TearDown() override
	{
		std::error_code Ec{};
		fs::remove_all(Dir, Ec);
	}

	void Write(fs::path const& Path, std::string const& Content)
	{
		std::ofstream Out(Path, std::ios::trunc);
		Out << Content;
	}
};

TEST_F(SnapshotFileTest, PodSourceMirrorsFileIntoStore)
{
	auto const Path = Dir / "pods.json";
	Write(Path, R"({ "pods": [ { "name": "web-0", "namespace": "default", "podIP": "10.1.1.5", "hostIP": "192.168.0.10" } ] })");

	WPodStore      Store{};
	WPodFileSource Source{ Path, Store, std::chrono::milliseconds(10) };
	ASSERT_TRUE(Source.Poll());
	EXPECT_EQ(Store.Size(), 1u);

	// unchanged file is not reloaded
	ASSERT_TRUE(Source.Poll());
	EXPECT_EQ(Store.Size(), 1u);

	Write(Path, R"({ "pods": [] })");
	fs::last_write_time(Path, fs::last_write_time(Path) + std::chrono::seconds(5));
	ASSERT_TRUE(Source.Poll());
	EXPECT_EQ(Store.Size(), 0u);
}

TEST_F(SnapshotFileTest, PodSourceKeepsStoreOnBadFile)
{
	auto const Path = Dir / "pods.json";
	Write(Path, R"({ "pods": [ { "name": "web-0", "namespace": "default" } ] })");

	WPodStore      Store{};
	WPodFileSource Source{ Path, Store, std::chrono::milliseconds(10) };
	ASSERT_TRUE(Source.Poll());

	Write(Path, "{ not json");
	fs::last_write_time(Path, fs::last_write_time(Path) + std::chrono::seconds(5));
	EXPECT_FALSE(Source.Poll());
	EXPECT_EQ(Store.Size(), 1u);

	fs::remove(Path);
	EXPECT_FALSE(Source.Poll());
	EXPECT_EQ(Store.Size(), 1u);
}

TEST_F(SnapshotFileTest, MissingPolicyFileMeansNoPolicies)
{
	WPolicyFileSource Source{ Dir / "policies.json" };
	WNetworkPolicies  Policies{ WNetworkPolicyInfo{ .Name = "stale" } };
	ASSERT_TRUE(Source.GetPolicies(Policies));
	EXPECT_TRUE(Policies.empty());
}

TEST_F(SnapshotFileTest, BrokenPolicyFileFails)
{
	Write(Dir / "policies.json", "[]");
	WPolicyFileSource Source{ Dir / "policies.json" };
	WNetworkPolicies  Policies{};
	EXPECT_FALSE(Source.GetPolicies(Policies));
}
