//
// Created by usr on 08/10/2025.
//

#include "NetworkInterface.hpp"

#include "ErrnoUtil.hpp"
#include "spdlog/spdlog.h"

#include <ifaddrs.h>
#include <unordered_set>
#include <vector>
#include <string>
#include <arpa/inet.h>
#include <netinet/in.h>

std::vector<std::string> WNetworkInterface::list()
{
	std::vector<std::string>        Result;
	std::unordered_set<std::string> Seen;

	ifaddrs* Ifaddr = nullptr;
	if (getifaddrs(&Ifaddr) != 0 || !Ifaddr)
	{
		return Result; // return empty on failure
	}

	for (ifaddrs* Ifa = Ifaddr; Ifa != nullptr; Ifa = Ifa->ifa_next)
	{
		if (!Ifa->ifa_name)
			continue;
		std::string Name{ Ifa->ifa_name };
		if (Seen.insert(Name).second)
		{
			Result.emplace_back(std::move(Name));
		}
	}

	freeifaddrs(Ifaddr);
	return Result;
}

std::string WNetworkInterface::GetIPv4Address(std::string const& Ifname)
{
	if (Ifname.empty())
	{
		spdlog::warn("WNetworkInterface::GetIPv4Address: ifname is empty");
		return {};
	}

	ifaddrs* Ifaddr = nullptr;
	if (getifaddrs(&Ifaddr) != 0 || !Ifaddr)
	{
		spdlog::error("getifaddrs failed: {}", WErrnoUtil::StrError());
		return {};
	}

	std::string Result{};
	for (ifaddrs* Ifa = Ifaddr; Ifa != nullptr; Ifa = Ifa->ifa_next)
	{
		if (!Ifa->ifa_name || !Ifa->ifa_addr || Ifa->ifa_addr->sa_family != AF_INET)
			continue;
		if (Ifname != Ifa->ifa_name)
			continue;

		auto const* Addr4 = reinterpret_cast<sockaddr_in const*>(Ifa->ifa_addr);
		char        Buffer[INET_ADDRSTRLEN]{};
		if (inet_ntop(AF_INET, &Addr4->sin_addr, Buffer, INET_ADDRSTRLEN))
		{
			Result = Buffer;
			break;
		}
	}

	freeifaddrs(Ifaddr);
	if (Result.empty())
	{
		spdlog::warn("Network interface '{}' has no IPv4 address", Ifname);
	}
	return Result;
}
