/*  This file is part of CdcBench, a verification harness for clock domain crossing FIFOs.
	Copyright (C) 2021 Michael Offel, Andreas Ley

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
#include "UnitTestSimulationFixture.h"

#include "Simulator.h"

#include <boost/test/unit_test.hpp>

namespace cdcb::sim {

UnitTestSimulationFixture::UnitTestSimulationFixture()
{
	m_simulator = std::make_unique<Simulator>();
	m_simulator->addCallbacks(this);
}

UnitTestSimulationFixture::~UnitTestSimulationFixture()
{
}

void UnitTestSimulationFixture::addSimulationProcess(std::function<SimProcess()> simProc)
{
	m_simulator->addSimulationProcess(std::move(simProc));
}

void UnitTestSimulationFixture::runEdges(const ClockDomain &clock, size_t numEdges)
{
	m_simulator->runEdges(clock, numEdges);
	reportIssues();
}

void UnitTestSimulationFixture::runFor(const SimTime &duration)
{
	if (!m_simulator->powerOnCalled())
		m_simulator->powerOn();
	m_simulator->advance(duration);
	reportIssues();
}

void UnitTestSimulationFixture::runCoroutine(SimProcess process)
{
	m_simulator->executeCoroutine(std::move(process));
	reportIssues();
}

void UnitTestSimulationFixture::reportIssues()
{
	if (!m_errors.empty())
		BOOST_FAIL(m_errors.front());
	if (!m_warnings.empty())
		BOOST_ERROR(m_warnings.front());
}

void UnitTestSimulationFixture::onDebugMessage(std::string msg)
{
	BOOST_TEST_MESSAGE(msg);
}

void UnitTestSimulationFixture::onWarning(std::string msg)
{
	m_warnings.push_back(msg);
}

void UnitTestSimulationFixture::onAssert(std::string msg)
{
	m_errors.push_back(msg);
}

}
