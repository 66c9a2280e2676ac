/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Hash.hpp"

#include <algorithm>
#include <openssl/sha.h>

WHash::WSha256Digest WHash::Sha256(std::string_view Data)
{
	WSha256Digest Out{};
	SHA256(reinterpret_cast<unsigned char const*>(Data.data()), Data.size(), Out.data());
	return Out;
}

std::string WHash::Base32(uint8_t const* Data, size_t Size)
{
	static constexpr char const* Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

	std::string Result{};
	Result.reserve((Size + 4) / 5 * 8);

	// 5 input bytes -> 8 output characters
	for (size_t i = 0; i < Size; i += 5)
	{
		size_t const Chunk = std::min<size_t>(5, Size - i);
		uint64_t     Bits = 0;
		for (size_t j = 0; j < 5; ++j)
		{
			Bits <<= 8;
			if (j < Chunk)
			{
				Bits |= Data[i + j];
			}
		}

		size_t const Chars = (Chunk * 8 + 4) / 5;
		for (size_t j = 0; j < 8; ++j)
		{
			if (j < Chars)
			{
				Result.push_back(Alphabet[(Bits >> (35 - j * 5)) & 0x1F]);
			}
			else
			{
				Result.push_back('=');
			}
		}
	}
	return Result;
}
