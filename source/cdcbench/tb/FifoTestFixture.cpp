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
#include "FifoTestFixture.h"

#include "../simulation/Simulator.h"

namespace cdcb::tb {

FifoTestFixture::FifoTestFixture()
{
	dbg::logNothing();
}

FifoTestFixture::~FifoTestFixture()
{
	dbg::logNothing();
}

void FifoTestFixture::setup(const TestbenchConfig &config)
{
	setupInterface(config);
	attachModel();
}

void FifoTestFixture::setupInterface(const TestbenchConfig &config)
{
	CDCB_DESIGNCHECK_HINT(!m_fifo, "The fixture can only be set up once");
	m_config = config;

	if (m_config.logLevel)
		dbg::logConsole(*m_config.logLevel);

	m_writeClock = &m_simulator->createClock(m_config.writeClock);
	m_readClock = &m_simulator->createClock(m_config.readClock);
	m_fifo = std::make_unique<dev::FifoInterface>(*m_writeClock, *m_readClock);
	m_bench = std::make_unique<FifoTestbench>(*m_fifo, m_config);

	if (m_config.vcdFile)
		m_vcd = std::make_unique<sim::VCDSink>(*m_simulator, m_fifo->allPins(), *m_config.vcdFile);
}

void FifoTestFixture::attachModel()
{
	CDCB_DESIGNCHECK_HINT(m_fifo, "setupInterface() must be called first");
	m_model = std::make_unique<dev::AsyncFifoModel>(*m_fifo, m_config.device);
	m_simulator->addClockedComponent(m_model.get());
}

void FifoTestFixture::attachDevice(sim::ClockedComponent &device)
{
	CDCB_DESIGNCHECK_HINT(m_fifo, "setupInterface() must be called first");
	m_simulator->addClockedComponent(&device);
}

void FifoTestFixture::runScenario(std::function<SimProcess()> scenario)
{
	m_scenarios.push_back(std::move(scenario));
	runCoroutine(m_scenarios.back()());
}

}
