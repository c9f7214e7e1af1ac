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
#include "cdcbench/pch.h"
#include "Sequences.h"

#include "../utils/Exceptions.h"

#include <algorithm>
#include <random>

namespace cdcb::tb::sequences {

std::vector<Transaction> writes(std::span<const std::uint8_t> values)
{
	std::vector<Transaction> result;
	result.reserve(values.size());
	for (auto v : values)
		result.push_back(Transaction::write(v));
	return result;
}

std::vector<Transaction> reads(size_t count)
{
	return std::vector<Transaction>(count, Transaction::read());
}

std::vector<Transaction> writeThenRead(std::span<const std::uint8_t> values)
{
	std::vector<Transaction> result = writes(values);
	for (size_t i = 0; i < values.size(); i++)
		result.push_back(Transaction::read());
	return result;
}

std::vector<Transaction> randomChunks(size_t count, size_t chunkSize, std::uint32_t seed)
{
	CDCB_DESIGNCHECK_HINT(chunkSize > 0, "Chunks must hold at least one transfer");

	std::mt19937 rng(seed);
	std::uniform_int_distribution<unsigned> byteDist(0, 0xFF);

	std::vector<Transaction> result;
	for (size_t offset = 0; offset < count; offset += chunkSize) {
		size_t size = std::min(chunkSize, count - offset);
		std::vector<std::uint8_t> chunk(size);
		for (auto &v : chunk)
			v = (std::uint8_t) byteDist(rng);

		auto chunkTransactions = writeThenRead(chunk);
		result.insert(result.end(), chunkTransactions.begin(), chunkTransactions.end());
	}
	return result;
}

std::vector<std::uint8_t> payloads(std::span<const Transaction> transactions)
{
	std::vector<std::uint8_t> result;
	for (const auto &t : transactions)
		if (t.isWrite())
			result.push_back(t.payload());
	return result;
}

}
