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

#include "../simulation/Pin.h"

#include <cstdint>
#include <vector>

namespace cdcb::sim {
	class ClockDomain;
}

namespace cdcb::dev {

using sim::Pin;
using sim::PinBase;

/// Pins of the write side, sampled on edges of the write clock.
struct FifoWritePins
{
	Pin<bool> rst{ "rst_wr", PinBase::INPUT };
	Pin<bool> wr{ "wr", PinBase::INPUT };
	Pin<std::uint8_t> dataIn{ "data_in", PinBase::INPUT };
	Pin<bool> full{ "full", PinBase::OUTPUT };
};

/// Pins of the read side, sampled on edges of the read clock.
struct FifoReadPins
{
	Pin<bool> rst{ "rst_rd", PinBase::INPUT };
	Pin<bool> rd{ "rd", PinBase::INPUT };
	Pin<std::uint8_t> dataOut{ "data_out", PinBase::OUTPUT };
	Pin<bool> empty{ "empty", PinBase::OUTPUT };
};

/**
 * @brief The complete pin level interface of a dual clock FIFO together with the two clocks it is bound to.
 * @details Harness components receive this interface at construction, there is no global device handle.
 */
class FifoInterface
{
	public:
		FifoInterface(const sim::ClockDomain &writeClock, const sim::ClockDomain &readClock) : m_writeClock(writeClock), m_readClock(readClock) { }

		FifoInterface(const FifoInterface &) = delete;
		FifoInterface &operator=(const FifoInterface &) = delete;

		const sim::ClockDomain &writeClock() const { return m_writeClock; }
		const sim::ClockDomain &readClock() const { return m_readClock; }

		FifoWritePins write;
		FifoReadPins read;

		std::vector<const PinBase*> allPins() const {
			return { &write.rst, &write.wr, &write.dataIn, &write.full, &read.rst, &read.rd, &read.dataOut, &read.empty };
		}
	protected:
		const sim::ClockDomain &m_writeClock;
		const sim::ClockDomain &m_readClock;
};

}
