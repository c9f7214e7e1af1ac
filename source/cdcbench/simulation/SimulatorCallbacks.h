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

#include "SimTime.h"

#include <string>
#include <vector>

namespace cdcb::sim {

class ClockDomain;
class PinBase;

/**
 * @brief Interface for classes that want to be informed of simulator events.
 */
class SimulatorCallbacks
{
	public:
		virtual ~SimulatorCallbacks() = default;

		/**
		 * @brief Called immediately when the simulation is powered on, before clocked components and simulation processes are initialized.
		 */
		virtual void onPowerOn() { }

		/**
		 * @brief Called whenever all processes of a time step have run and signals are stable.
		 * @details This is where checks can be performed or states can be written to waveform files.
		 */
		virtual void onCommitState() { }

		/**
		 * @brief Called whenever the simulation time advances, but before any clocked component saw the edges of this time step.
		 * @param simulationTime The new simulator time.
		 */
		virtual void onNewTick(const SimTime &simulationTime) { }

		/**
		 * @brief Called for every edge of a clock, before clocked components update.
		 */
		virtual void onClock(const ClockDomain &clock) { }

		/**
		 * @brief Called when a simulation process assigns a value to a pin.
		 */
		virtual void onPinDriven(const PinBase &pin) { }

		virtual void onDebugMessage(std::string msg) { }
		virtual void onWarning(std::string msg) { }
		virtual void onAssert(std::string msg) { }
};


/// Forwards all events to a list of registered callbacks.
class CallbackDispatcher : public SimulatorCallbacks
{
	public:
		void addCallbacks(SimulatorCallbacks *c) { m_callbacks.push_back(c); }
		void removeCallbacks(SimulatorCallbacks *c);

		virtual void onPowerOn() override;
		virtual void onCommitState() override;
		virtual void onNewTick(const SimTime &simulationTime) override;
		virtual void onClock(const ClockDomain &clock) override;
		virtual void onPinDriven(const PinBase &pin) override;

		virtual void onDebugMessage(std::string msg) override;
		virtual void onWarning(std::string msg) override;
		virtual void onAssert(std::string msg) override;
	protected:
		std::vector<SimulatorCallbacks*> m_callbacks;
};

}
