/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include "TestPods.hpp"
#include "Firewall/LocalPods.hpp"

TEST(LocalPodResolver, KeepsOnlyAddressedPodsOnThisNode)
{
	WStaticPodLister Lister{};
	Lister.Pods = {
		MakePodPtr("web-0", "default", "10.1.1.5", "192.168.0.10"),
		MakePodPtr("web-1", "default", "10.1.2.7", "192.168.0.11"),
		MakePodPtr("pending", "default", "", "192.168.0.10", EPodPhase::Pending),
		MakePodPtr("db-0", "prod", "10.1.1.9", "192.168.0.10"),
	};

	WLocalPodResolver Resolver{ Lister };
	WLocalPods        Pods{};
	ASSERT_TRUE(Resolver.GetLocalPods("192.168.0.10", Pods));

	ASSERT_EQ(Pods.size(), 2u);
	ASSERT_TRUE(Pods.contains("10.1.1.5"));
	ASSERT_TRUE(Pods.contains("10.1.1.9"));
	EXPECT_EQ(Pods["10.1.1.5"].Name, "web-0");
	EXPECT_EQ(Pods["10.1.1.5"].Namespace, "default");
	EXPECT_EQ(Pods["10.1.1.9"].IP, "10.1.1.9");
}

TEST(LocalPodResolver, EmptyClusterIsNotAnError)
{
	WStaticPodLister  Lister{};
	WLocalPodResolver Resolver{ Lister };
	WLocalPods        Pods{ { "stale", {} } };

	ASSERT_TRUE(Resolver.GetLocalPods("192.168.0.10", Pods));
	EXPECT_TRUE(Pods.empty());
}

TEST(LocalPodResolver, ReportsUnreadableCache)
{
	WStaticPodLister Lister{};
	Lister.bFail = true;

	WLocalPodResolver Resolver{ Lister };
	WLocalPods        Pods{};
	EXPECT_FALSE(Resolver.GetLocalPods("192.168.0.10", Pods));
}

TEST(LocalPodResolver, CopiesLabels)
{
	auto Pod = MakePod("web-0", "default", "10.1.1.5", "192.168.0.10");
	Pod.Labels = { { "app", "web" } };

	WStaticPodLister Lister{};
	Lister.Pods = { std::make_shared<WPodItem const>(Pod) };

	WLocalPodResolver Resolver{ Lister };
	WLocalPods        Pods{};
	ASSERT_TRUE(Resolver.GetLocalPods("192.168.0.10", Pods));
	EXPECT_EQ(Pods["10.1.1.5"].Labels.at("app"), "web");
}
