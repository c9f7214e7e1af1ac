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
#include "ResetCoordinator.h"

#include "../debug/DebugInterface.h"
#include "../simulation/simProc/WaitClock.h"

namespace cdcb::tb {

using sim::OnClk;
using sim::simu;
using dbg::LogMessage;

ResetCoordinator::ResetCoordinator(dev::FifoInterface &fifo, ResetConfig config) : m_fifo(fifo), m_config(config)
{
}

SimProcess ResetCoordinator::reset()
{
	co_await reset(m_config.holdEdges, m_config.settleEdges);
}

SimProcess ResetCoordinator::reset(size_t holdEdges, size_t settleEdges)
{
	CDCB_DESIGNCHECK_HINT(holdEdges > 0, "The reset must be held for at least one edge of each clock");

	m_state = RESETTING;
	m_numResets++;
	dbg::log(LogMessage() << LogMessage::LOG_INFO << LogMessage::LOG_RESET << "Asserting reset for " << holdEdges << " edges");

	simu(m_fifo.write.rst) = true;
	simu(m_fifo.read.rst) = true;
	simu(m_fifo.write.wr) = false;
	simu(m_fifo.write.dataIn) = 0;
	simu(m_fifo.read.rd) = false;

	co_await advanceBothClocks(holdEdges);

	simu(m_fifo.write.rst) = false;
	simu(m_fifo.read.rst) = false;

	co_await advanceBothClocks(settleEdges);

	m_state = OPERATIONAL;
	dbg::log(LogMessage() << LogMessage::LOG_INFO << LogMessage::LOG_RESET << "Operational after " << settleEdges << " settle edges");
	m_becameOperational.notify_all();
}

SimProcess ResetCoordinator::waitOperational()
{
	while (m_state != OPERATIONAL)
		co_await m_becameOperational.wait();
}

SimProcess ResetCoordinator::advanceBothClocks(size_t edges)
{
	for (size_t i = 0; i < edges; i++) {
		co_await OnClk(m_fifo.writeClock());
		co_await OnClk(m_fifo.readClock());
	}
}

}
