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

#include "../device/FifoInterface.h"
#include "../simulation/simProc/Condition.h"
#include "../simulation/simProc/SimulationProcess.h"

namespace cdcb::tb {

struct ResetConfig
{
	/// Edges of each clock during which both resets are held asserted.
	size_t holdEdges = 4;
	/// Edges of each clock after release before the flags are trusted.
	size_t settleEdges = 4;
};

/**
 * @brief Brings both clock domains of the FIFO through a synchronized reset.
 * @details While resetting, both resets are asserted, strobes are held low and data_in is 0. Both clocks are advanced
 * in lockstep (one edge of each per iteration). The coordinator only owns the reset lines and does not cancel
 * processes that are still driving, stopping those before a reset is up to the caller.
 */
class ResetCoordinator
{
	public:
		enum State {
			RESETTING,
			OPERATIONAL
		};

		ResetCoordinator(dev::FifoInterface &fifo, ResetConfig config = {});

		/// Runs a complete reset sequence with the configured edge counts.
		SimProcess reset();
		SimProcess reset(size_t holdEdges, size_t settleEdges);

		/// Suspends until the coordinator is operational. Returns immediately if it already is.
		SimProcess waitOperational();

		State state() const { return m_state; }
		bool operational() const { return m_state == OPERATIONAL; }
		size_t numResets() const { return m_numResets; }
		const ResetConfig &config() const { return m_config; }
	protected:
		dev::FifoInterface &m_fifo;
		ResetConfig m_config;
		State m_state = RESETTING;
		size_t m_numResets = 0;
		sim::Condition m_becameOperational;

		SimProcess advanceBothClocks(size_t edges);
};

}
