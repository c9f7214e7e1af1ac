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

#include "Sequencer.h"
#include "Transaction.h"

#include "../device/FifoInterface.h"
#include "../simulation/simProc/SimulationProcess.h"

#include <cstdint>

namespace cdcb::tb {

/**
 * @brief Drives the write side handshake of the FIFO.
 * @details All operations first wait for an edge of the write clock, so pins are only ever changed right after an edge of their own domain.
 * Readiness polling is bounded by maxWaitEdges.
 */
class WritePort
{
	public:
		WritePort(dev::FifoInterface &fifo, size_t maxWaitEdges);

		/// Waits for full to clear, then pulses wr for one edge. Returns false if full did not clear within maxWaitEdges edges.
		SimFunction<bool> tryWrite(std::uint8_t payload);
		/// Like tryWrite, but a timeout is a LivenessTimeout.
		SimProcess write(std::uint8_t payload);
		/// Pulses wr for one edge regardless of full.
		SimProcess attemptWrite(std::uint8_t payload);

		size_t maxWaitEdges() const { return m_maxWaitEdges; }
		void maxWaitEdges(size_t edges) { m_maxWaitEdges = edges; }
	protected:
		dev::FifoInterface &m_fifo;
		size_t m_maxWaitEdges;

		bool notReady() const;
		SimProcess pulse(std::uint8_t payload);
};

/**
 * @brief Drives the read side handshake of the FIFO.
 * @details Never looks at data_out, the read data is observed by the monitor one edge later.
 */
class ReadPort
{
	public:
		ReadPort(dev::FifoInterface &fifo, size_t maxWaitEdges);

		/// Waits for empty to clear, then pulses rd for one edge. Returns false if empty did not clear within maxWaitEdges edges.
		SimFunction<bool> tryRead();
		/// Like tryRead, but a timeout is a LivenessTimeout.
		SimProcess read();
		/// Pulses rd for one edge regardless of empty.
		SimProcess attemptRead();

		size_t maxWaitEdges() const { return m_maxWaitEdges; }
		void maxWaitEdges(size_t edges) { m_maxWaitEdges = edges; }
	protected:
		dev::FifoInterface &m_fifo;
		size_t m_maxWaitEdges;

		bool notReady() const;
		SimProcess pulse();
};

/**
 * @brief Executes the transactions of a sequencer one after another on the two ports.
 * @details Writes and reads of one sequencer never overlap. Scenarios that need concurrent writes and reads
 * use the ports from two processes instead.
 */
class FifoDriver
{
	public:
		FifoDriver(Sequencer &sequencer, WritePort &writePort, ReadPort &readPort);

		/// Runs until the sequencer is closed and drained or stop() was requested.
		SimProcess run();
		/// The loop ends after the transaction currently in flight.
		void stop() { m_stopRequested = true; }

		bool running() const { return m_running; }
		size_t numWrites() const { return m_numWrites; }
		size_t numReads() const { return m_numReads; }
	protected:
		Sequencer &m_sequencer;
		WritePort &m_writePort;
		ReadPort &m_readPort;

		bool m_stopRequested = false;
		bool m_running = false;
		size_t m_numWrites = 0;
		size_t m_numReads = 0;
};

}
