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
#pragma once

#include "SimulatorCallbacks.h"
#include "simProc/SimulationProcess.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cdcb::sim {

	class Simulator;
	class ClockDomain;

/**
 * @brief Boost.Test fixture owning a simulator.
 * @details Warnings reported by the simulation turn into test errors, asserts fail the test.
 */
	class UnitTestSimulationFixture : public SimulatorCallbacks
	{
	public:
		UnitTestSimulationFixture();
		~UnitTestSimulationFixture();

		void addSimulationProcess(std::function<SimProcess()> simProc);

		void runEdges(const ClockDomain &clock, size_t numEdges);
		void runFor(const SimTime &duration);
		void runCoroutine(SimProcess process);

		virtual void onDebugMessage(std::string msg) override;
		virtual void onWarning(std::string msg) override;
		virtual void onAssert(std::string msg) override;

		Simulator& getSimulator() { return *m_simulator; }
		const std::vector<std::string> &getWarnings() const { return m_warnings; }
	protected:
		std::unique_ptr<Simulator> m_simulator;

		std::vector<std::string> m_warnings;
		std::vector<std::string> m_errors;

		void reportIssues();
	};

}
