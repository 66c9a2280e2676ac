/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

class WHash
{
public:
	using WSha256Digest = std::array<uint8_t, 32>;

	static WSha256Digest Sha256(std::string_view Data);

	// RFC 4648 base32 with the standard alphabet and '=' padding
	static std::string Base32(uint8_t const* Data, size_t Size);

	static std::string Base32(WSha256Digest const& Digest) { return Base32(Digest.data(), Digest.size()); }
};
