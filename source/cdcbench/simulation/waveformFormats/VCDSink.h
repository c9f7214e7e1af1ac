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

#include "VCDWriter.h"
#include "../SimulatorCallbacks.h"

#include <cstdint>
#include <string>
#include <vector>

namespace cdcb::sim {

class Simulator;
class PinBase;

/**
 * @brief Records pins and clock edge counters of a simulation into a VCD file.
 * @details Values are sampled on every commit, i.e. once the processes of a time step have run.
 * Each clock is represented by a 32 bit counter of its edges since there is no notion of time between edges.
 */
class VCDSink : public SimulatorCallbacks
{
	public:
		VCDSink(Simulator &simulator, std::vector<const PinBase*> pins, std::string filename);
		~VCDSink();

		virtual void onPowerOn() override;
		virtual void onNewTick(const SimTime &simulationTime) override;
		virtual void onCommitState() override;
	protected:
		struct Trace {
			std::string code;
			std::uint64_t value = 0;
			bool defined = false;
		};

		Simulator &m_simulator;
		VCDWriter m_writer;
		std::vector<const PinBase*> m_pins;
		std::vector<Trace> m_pinTraces;
		std::vector<Trace> m_clockTraces;
		bool m_dumpedInitialValues = false;

		void declare();
		void writeChanges(bool force);
		static std::string makeCode(size_t index);
};

}
