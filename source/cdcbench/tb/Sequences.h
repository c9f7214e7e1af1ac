/*  This file is part of CdcBench, a verification harness for clock domain crossing FIFOs.
	Copyright (C) 2026 The CdcBench contributors

	CdcBench is free software; you can redistribute it and/or
	modify it under the terms of the GNU Lesser General Public
	License as published by the Free Software Foundation; either
	version 3 of the License, or (at your option) any later version.

	CdcBench is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
	Lesser General Public License for more details.

	You should have received a copy of the GNU Lesser General Public
	License along with this library; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
*/
#pragma once

#include "Transaction.h"

#include <cstdint>
#include <span>
#include <vector>

namespace cdcb::tb::sequences {

/// One write per value, in order.
std::vector<Transaction> writes(std::span<const std::uint8_t> values);
/// count reads.
std::vector<Transaction> reads(size_t count);
/// All values written first, then read back.
std::vector<Transaction> writeThenRead(std::span<const std::uint8_t> values);

/**
 * @brief count random bytes in chunks: each chunk is written completely and then read back completely.
 * @details The values are drawn from a std::mt19937 seeded with seed, so a seed always yields the same sequence.
 */
std::vector<Transaction> randomChunks(size_t count, size_t chunkSize, std::uint32_t seed);

/// Extracts the payloads of all writes, in order.
std::vector<std::uint8_t> payloads(std::span<const Transaction> transactions);

}
