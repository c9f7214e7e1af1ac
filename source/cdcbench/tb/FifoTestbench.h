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
#include "FifoDriver.h"
#include "FifoMonitor.h"
#include "ResetCoordinator.h"
#include "Scoreboard.h"
#include "Sequencer.h"
#include "TestbenchConfig.h"

#include "../device/FifoInterface.h"
#include "../simulation/simProc/SimulationProcess.h"

#include <vector>

namespace cdcb::tb {

/**
 * @brief Complete verification environment for one FIFO interface.
 * @details Owns the sequencer, both ports, the driver, the monitors, the event channel, the scoreboard and the reset coordinator
 * and wires them to the given interface. Nothing runs until start() is called from within a simulation process.
 */
class FifoTestbench
{
	public:
		FifoTestbench(dev::FifoInterface &fifo, const TestbenchConfig &config);

		/// Forks the monitors, the scoreboard and the driver loop.
		void start();
		/// Asks all forked loops to end at their next resumption.
		void stop();

		/// Starts the testbench if necessary and resets the device.
		SimProcess bringUp();
		/// Resets the device, runs all transactions through the sequencer and lets the last events reach the scoreboard.
		SimProcess run(std::vector<Transaction> transactions);
		/// Advances both clocks by the given number of edges.
		SimProcess settle(size_t edges = 2);

		Sequencer &sequencer() { return m_sequencer; }
		WritePort &writePort() { return m_writePort; }
		ReadPort &readPort() { return m_readPort; }
		FifoDriver &driver() { return m_driver; }
		FifoMonitor &monitor() { return m_monitor; }
		Scoreboard &scoreboard() { return m_scoreboard; }
		ResetCoordinator &resetCoordinator() { return m_resetCoordinator; }
		EventChannel &events() { return m_events; }
		dev::FifoInterface &fifo() { return m_fifo; }

		const TestbenchConfig &config() const { return m_config; }
		bool started() const { return m_started; }
	protected:
		dev::FifoInterface &m_fifo;
		TestbenchConfig m_config;

		Sequencer m_sequencer;
		WritePort m_writePort;
		ReadPort m_readPort;
		FifoDriver m_driver;
		EventChannel m_events;
		FifoMonitor m_monitor;
		Scoreboard m_scoreboard;
		ResetCoordinator m_resetCoordinator;

		bool m_started = false;
};

}
