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

#include "FifoTestbench.h"
#include "TestbenchConfig.h"

#include "../device/AsyncFifoModel.h"
#include "../device/FifoInterface.h"
#include "../simulation/UnitTestSimulationFixture.h"
#include "../simulation/waveformFormats/VCDSink.h"

#include <functional>
#include <list>
#include <memory>

namespace cdcb::tb {

/**
 * @brief Unit test fixture with a simulator, both clocks, the pin interface and a testbench.
 * @details Either call setup() to run against the behavioural fifo model, or setupInterface() followed by
 * attachDevice() to run against a custom device.
 */
class FifoTestFixture : public sim::UnitTestSimulationFixture
{
	public:
		FifoTestFixture();
		~FifoTestFixture();

		void setup(const TestbenchConfig &config = {});
		void setupInterface(const TestbenchConfig &config = {});
		void attachModel();
		void attachDevice(sim::ClockedComponent &device);

		/// Runs the scenario as a process until it returns. The function object is kept alive for the lifetime of the fixture.
		void runScenario(std::function<SimProcess()> scenario);

		const sim::ClockDomain &writeClock() const { return *m_writeClock; }
		const sim::ClockDomain &readClock() const { return *m_readClock; }
		dev::FifoInterface &fifo() { return *m_fifo; }
		dev::AsyncFifoModel &model() { return *m_model; }
		FifoTestbench &bench() { return *m_bench; }
		const TestbenchConfig &config() const { return m_config; }
	protected:
		TestbenchConfig m_config;
		const sim::ClockDomain *m_writeClock = nullptr;
		const sim::ClockDomain *m_readClock = nullptr;
		std::unique_ptr<dev::FifoInterface> m_fifo;
		std::unique_ptr<dev::AsyncFifoModel> m_model;
		std::unique_ptr<FifoTestbench> m_bench;
		std::unique_ptr<sim::VCDSink> m_vcd;
		std::list<std::function<SimProcess()>> m_scenarios;
};

}
