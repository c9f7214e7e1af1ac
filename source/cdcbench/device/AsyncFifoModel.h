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

#include "FifoInterface.h"
#include "../simulation/Simulator.h"

#include <cstdint>
#include <vector>

namespace cdcb::dev {

struct AsyncFifoParams
{
	/// Number of entries, must be a power of two.
	size_t depth = 8;
	/// Number of flip flops each pointer passes when crossing into the other clock domain.
	size_t syncStages = 2;
};

/**
 * @brief Behavioural model of a dual clock FIFO with gray coded pointers.
 * @details Write and read pointers are one bit wider than the address. Each pointer crosses into the other domain
 * as gray code through a chain of synchronizer registers. Both flags are registered and pessimistic:
 * full is computed in the write domain against the synchronized read pointer, empty in the read domain against the synchronized write pointer.
 * data_out is registered and updates on the edge that accepts a read request.
 * Both resets are synchronous and active high. Until the first reset all outputs are undefined.
 */
class AsyncFifoModel : public sim::ClockedComponent
{
	public:
		AsyncFifoModel(FifoInterface &interface, AsyncFifoParams params = {});

		virtual void onPowerOn() override;
		virtual void onClockEdge(const sim::ClockDomain &clock) override;

		const AsyncFifoParams &params() const { return m_params; }
		/// Number of entries as seen by the write side.
		size_t fillLevelWriteSide() const;
	protected:
		FifoInterface &m_interface;
		AsyncFifoParams m_params;

		struct Entry {
			std::uint8_t value = 0;
			bool defined = false;
		};
		std::vector<Entry> m_memory;

		std::uint64_t m_writePtr = 0;
		std::uint64_t m_readPtr = 0;
		std::vector<std::uint64_t> m_readPtrSyncToWrite;
		std::vector<std::uint64_t> m_writePtrSyncToRead;
		bool m_full = false;
		bool m_empty = true;
		bool m_writeResetSeen = false;
		bool m_readResetSeen = false;

		void writeEdge();
		void readEdge();

		std::uint64_t ptrMask() const { return 2 * m_params.depth - 1; }
		std::uint64_t addrMask() const { return m_params.depth - 1; }
};

std::uint64_t binaryToGray(std::uint64_t value);
std::uint64_t grayToBinary(std::uint64_t value);

}
