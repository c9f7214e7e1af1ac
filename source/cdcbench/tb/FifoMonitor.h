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

#include "Event.h"

#include "../device/FifoInterface.h"
#include "../simulation/simProc/SimulationProcess.h"

namespace cdcb::tb {

/**
 * @brief Passive observer of the write side.
 * @details Samples the settled pin values after every edge of the write clock. A write is accepted if wr is asserted
 * while full is deasserted at the same edge. While rst_wr is asserted (or undefined) nothing is observed, except that
 * entering reset publishes one RESET event.
 */
class WriteMonitor
{
	public:
		WriteMonitor(const dev::FifoInterface &fifo, EventChannel &events);

		SimProcess run();
		/// The loop ends at the next edge.
		void stop() { m_stopRequested = true; }

		size_t numWrites() const { return m_numWrites; }
	protected:
		const dev::FifoInterface &m_fifo;
		EventChannel &m_events;
		bool m_stopRequested = false;
		bool m_inReset = false;
		size_t m_numWrites = 0;
};

/**
 * @brief Passive observer of the read side.
 * @details The device registers data_out, so a request (rd asserted, empty deasserted) seen at edge N is completed by
 * sampling data_out at edge N+1. The request state of the previous edge is cleared whenever rst_rd is asserted.
 * A completion that falls onto the first edge of a reset is therefore not published, only counted in numDroppedReads().
 */
class ReadMonitor
{
	public:
		ReadMonitor(const dev::FifoInterface &fifo, EventChannel &events);

		SimProcess run();
		void stop() { m_stopRequested = true; }

		size_t numReads() const { return m_numReads; }
		size_t numDroppedReads() const { return m_numDroppedReads; }
	protected:
		const dev::FifoInterface &m_fifo;
		EventChannel &m_events;
		bool m_stopRequested = false;
		bool m_prevRead = false;
		bool m_prevEmpty = true;
		size_t m_numReads = 0;
		size_t m_numDroppedReads = 0;
};

/// Both observers feeding the same channel.
class FifoMonitor
{
	public:
		FifoMonitor(const dev::FifoInterface &fifo, EventChannel &events);

		/// Forks both observers. Must be called from within a simulation process.
		void start();
		void stop();

		WriteMonitor &writeSide() { return m_writeMonitor; }
		ReadMonitor &readSide() { return m_readMonitor; }
	protected:
		WriteMonitor m_writeMonitor;
		ReadMonitor m_readMonitor;
};

}
