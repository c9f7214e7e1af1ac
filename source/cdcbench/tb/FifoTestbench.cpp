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
#include "FifoTestbench.h"

#include "../simulation/simProc/WaitClock.h"

namespace cdcb::tb {

FifoTestbench::FifoTestbench(dev::FifoInterface &fifo, const TestbenchConfig &config) :
	m_fifo(fifo),
	m_config(config),
	m_writePort(fifo, config.maxWaitEdges),
	m_readPort(fifo, config.maxWaitEdges),
	m_driver(m_sequencer, m_writePort, m_readPort),
	m_monitor(fifo, m_events),
	m_resetCoordinator(fifo, config.reset)
{
}

void FifoTestbench::start()
{
	CDCB_DESIGNCHECK_HINT(!m_started, "The testbench can only be started once");
	m_started = true;

	m_monitor.start();
	sim::fork(m_scoreboard.run(m_events));
	sim::fork(m_driver.run());
}

void FifoTestbench::stop()
{
	m_driver.stop();
	m_monitor.stop();
	m_scoreboard.stop();
}

SimProcess FifoTestbench::bringUp()
{
	if (!m_started)
		start();

	co_await m_resetCoordinator.reset();
}

SimProcess FifoTestbench::run(std::vector<Transaction> transactions)
{
	co_await bringUp();

	m_sequencer.push(transactions);
	co_await m_sequencer.idle();

	// The read monitor reports a read one edge after the request.
	co_await settle();
}

SimProcess FifoTestbench::settle(size_t edges)
{
	for (size_t i = 0; i < edges; i++) {
		co_await sim::OnClk(m_fifo.writeClock());
		co_await sim::OnClk(m_fifo.readClock());
	}
}

}
