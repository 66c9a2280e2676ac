//
// Created by usr on 09/10/2025.
//

#pragma once

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <optional>
#include <system_error>

namespace stdfs = std::filesystem;

class WFilesystem
{
public:
	static bool Exists(stdfs::path const& p)
	{
		std::error_code Ec{};
		return stdfs::exists(p, Ec);
	}

	// Reads a whole file, nullopt if it can't be opened
	static std::optional<std::string> ReadFile(stdfs::path const& Path)
	{
		std::ifstream FileStream(Path, std::ios::in | std::ios::binary);
		if (!FileStream)
			return std::nullopt;

		std::ostringstream ss;
		ss << FileStream.rdbuf();
		return ss.str();
	}

	// Modification time used by the snapshot sources to skip unchanged files
	static std::optional<stdfs::file_time_type> LastWriteTime(stdfs::path const& Path)
	{
		std::error_code Ec{};
		auto            Time = stdfs::last_write_time(Path, Ec);
		if (Ec)
		{
			return std::nullopt;
		}
		return Time;
	}
};
