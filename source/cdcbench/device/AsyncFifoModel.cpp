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
#include "AsyncFifoModel.h"

#include "../debug/DebugInterface.h"

#include <algorithm>
#include <bit>

namespace cdcb::dev {

std::uint64_t binaryToGray(std::uint64_t value)
{
	return value ^ (value >> 1);
}

std::uint64_t grayToBinary(std::uint64_t value)
{
	std::uint64_t result = value;
	while (value >>= 1)
		result ^= value;
	return result;
}

AsyncFifoModel::AsyncFifoModel(FifoInterface &interface, AsyncFifoParams params) :
	m_interface(interface), m_params(params)
{
	CDCB_DESIGNCHECK_HINT(std::has_single_bit(m_params.depth), "The fifo depth must be a power of two");
	CDCB_DESIGNCHECK_HINT(m_params.syncStages >= 1, "At least one synchronizer stage is needed");

	m_memory.resize(m_params.depth);
	m_readPtrSyncToWrite.resize(m_params.syncStages, 0);
	m_writePtrSyncToRead.resize(m_params.syncStages, 0);
}

void AsyncFifoModel::onPowerOn()
{
	m_interface.write.full.invalidate();
	m_interface.read.empty.invalidate();
	m_interface.read.dataOut.invalidate();
	m_writeResetSeen = false;
	m_readResetSeen = false;
}

void AsyncFifoModel::onClockEdge(const sim::ClockDomain &clock)
{
	if (&clock == &m_interface.writeClock())
		writeEdge();
	if (&clock == &m_interface.readClock())
		readEdge();
}

size_t AsyncFifoModel::fillLevelWriteSide() const
{
	return (m_writePtr - grayToBinary(m_readPtrSyncToWrite.back())) & ptrMask();
}

void AsyncFifoModel::writeEdge()
{
	auto &pins = m_interface.write;

	// An undefined reset makes the whole write side undefined.
	if (!pins.rst.defined()) {
		pins.full.invalidate();
		m_writeResetSeen = false;
		return;
	}

	if (pins.rst.value()) {
		m_writePtr = 0;
		std::fill(m_readPtrSyncToWrite.begin(), m_readPtrSyncToWrite.end(), 0);
		m_full = false;
		pins.full.set(false);
		m_writeResetSeen = true;
		return;
	}

	if (!m_writeResetSeen)
		return;

	if (sim::asserted(pins.wr) && !m_full) {
		auto &entry = m_memory[m_writePtr & addrMask()];
		entry.value = pins.dataIn.value();
		entry.defined = pins.dataIn.defined();
		m_writePtr = (m_writePtr + 1) & ptrMask();
	}

	// The flag is registered against the synchronizer output from before this edge.
	std::uint64_t syncedReadPtr = grayToBinary(m_readPtrSyncToWrite.back());
	m_full = ((m_writePtr - syncedReadPtr) & ptrMask()) == m_params.depth;
	pins.full.set(m_full);

	for (size_t i = m_readPtrSyncToWrite.size() - 1; i > 0; i--)
		m_readPtrSyncToWrite[i] = m_readPtrSyncToWrite[i - 1];
	m_readPtrSyncToWrite[0] = binaryToGray(m_readPtr);
}

void AsyncFifoModel::readEdge()
{
	auto &pins = m_interface.read;

	if (!pins.rst.defined()) {
		pins.empty.invalidate();
		pins.dataOut.invalidate();
		m_readResetSeen = false;
		return;
	}

	if (pins.rst.value()) {
		m_readPtr = 0;
		std::fill(m_writePtrSyncToRead.begin(), m_writePtrSyncToRead.end(), 0);
		m_empty = true;
		pins.empty.set(true);
		pins.dataOut.set(0);
		m_readResetSeen = true;
		return;
	}

	if (!m_readResetSeen)
		return;

	if (sim::asserted(pins.rd) && !m_empty) {
		const auto &entry = m_memory[m_readPtr & addrMask()];
		if (entry.defined)
			pins.dataOut.set(entry.value);
		else
			pins.dataOut.invalidate();
		m_readPtr = (m_readPtr + 1) & ptrMask();
	}

	std::uint64_t syncedWritePtr = grayToBinary(m_writePtrSyncToRead.back());
	m_empty = m_readPtr == syncedWritePtr;
	pins.empty.set(m_empty);

	for (size_t i = m_writePtrSyncToRead.size() - 1; i > 0; i--)
		m_writePtrSyncToRead[i] = m_writePtrSyncToRead[i - 1];
	m_writePtrSyncToRead[0] = binaryToGray(m_writePtr);
}

}
