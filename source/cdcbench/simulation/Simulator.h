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

#include "Clock.h"
#include "SimulatorCallbacks.h"
#include "simProc/SimulationProcess.h"

#include <coroutine>
#include <functional>
#include <list>
#include <memory>
#include <queue>
#include <vector>

namespace cdcb::sim {

class WaitClock;
class WaitStable;

/**
 * @brief Behavioural model of hardware that reacts to clock edges.
 */
class ClockedComponent
{
	public:
		virtual ~ClockedComponent() = default;

		/// Called once on power on, before any simulation process runs.
		virtual void onPowerOn() { }
		/// Called for every edge of every clock. Input pins still hold the values driven before this edge.
		virtual void onClockEdge(const ClockDomain &clock) = 0;
};

/**
 * @brief Phases within one simulation time step.
 */
enum class TimingPhase {
	/// Clocked components sample their inputs and update their registers.
	DURING,
	/// Processes waiting for one of the edges resume and drive new stimuli.
	AFTER,
	/// Processes waiting for stable values resume. Pins can not be driven.
	STABLE
};

/**
 * @brief Edge driven simulator that interleaves clocked components and simulation processes.
 * @details Time only advances from clock edge to clock edge. All edges that fall onto the same time form one time step
 * which runs through the phases DURING, AFTER and STABLE. Edges of coinciding clocks are processed in the order the clocks were created.
 */
class Simulator
{
	public:
		Simulator();
		~Simulator();

		/// The simulator that is currently advancing on this thread, if any.
		static Simulator *current();

		ClockDomain &createClock(ClockConfig config);
		const std::vector<std::unique_ptr<ClockDomain>> &getClocks() const { return m_clocks; }

		void addClockedComponent(ClockedComponent *component);
		void addCallbacks(SimulatorCallbacks *callbacks) { m_callbackDispatcher.addCallbacks(callbacks); }
		void removeCallbacks(SimulatorCallbacks *callbacks) { m_callbackDispatcher.removeCallbacks(callbacks); }

		/// Registers a process that starts on power on, or immediately if the simulation is already powered on.
		void addSimulationProcess(std::function<SimProcess()> simProc);

		void powerOn();
		/// Processes all edges of the next time step.
		void advanceEvent();
		/// Processes all time steps up to and including now + duration.
		void advance(const SimTime &duration);
		/// Processes time steps until the given clock had numEdges more edges.
		void runEdges(const ClockDomain &clock, size_t numEdges);

		/**
		 * @brief Runs a simulation function as a process and advances the simulation until it returns.
		 * @details Powers on the simulation if necessary. Exceptions thrown by any process propagate out of this call.
		 */
		template<typename ReturnValue>
		ReturnValue executeCoroutine(SimulationFunction<ReturnValue> coroutine);

		bool powerOnCalled() const { return m_powerOnCalled; }
		const SimTime &getCurrentSimulationTime() const { return m_simulationTime; }
		TimingPhase getCurrentPhase() const { return m_phase; }
		bool readOnlyMode() const { return m_readOnlyMode; }

		void onDebugMessage(std::string msg);
		void onWarning(std::string msg);
		void onAssert(std::string msg);
		void onPinDriven(const PinBase &pin);

		void simulationProcessSuspending(std::coroutine_handle<> handle, WaitClock &waitClock);
		void simulationProcessSuspending(std::coroutine_handle<> handle, WaitStable &waitStable);
	protected:
		struct Edge {
			SimTime time;
			size_t clockIndex;

			bool operator>(const Edge &rhs) const {
				if (time != rhs.time) return time > rhs.time;
				return clockIndex > rhs.clockIndex;
			}
		};

		struct AwaitingProcess {
			size_t order;
			std::coroutine_handle<> handle;
		};

		/// Makes this simulator the current one for the lifetime of the scope.
		class ActiveScope {
			public:
				ActiveScope(Simulator &simulator);
				~ActiveScope();
			protected:
				Simulator *m_last;
		};

		std::vector<std::unique_ptr<ClockDomain>> m_clocks;
		std::vector<std::vector<AwaitingProcess>> m_awaitingClock;
		std::vector<std::coroutine_handle<>> m_awaitingStable;
		std::priority_queue<Edge, std::vector<Edge>, std::greater<Edge>> m_nextEdges;
		size_t m_suspendCounter = 0;

		std::vector<ClockedComponent*> m_clockedComponents;
		std::list<std::function<SimProcess()>> m_simProcs;
		CallbackDispatcher m_callbackDispatcher;
		SimulationCoroutineHandler m_coroutineHandler;

		bool m_powerOnCalled = false;
		SimTime m_simulationTime;
		TimingPhase m_phase = TimingPhase::AFTER;
		bool m_readOnlyMode = false;

		void scheduleNextEdge(const ClockDomain &clock);
		void runReadyProcesses();
		void runStablePhase();
};

template<typename ReturnValue>
ReturnValue Simulator::executeCoroutine(SimulationFunction<ReturnValue> coroutine)
{
	if (!m_powerOnCalled)
		powerOn();

	{
		ActiveScope scope(*this);
		m_coroutineHandler.start(coroutine);
		runReadyProcesses();
		runStablePhase();
	}

	while (!coroutine.done()) {
		CDCB_DESIGNCHECK_HINT(!m_nextEdges.empty(), "The simulation can not advance, create a clock before waiting on coroutines");
		advanceEvent();
	}

	if constexpr (!std::is_void_v<ReturnValue>)
		return coroutine.getHandle().promise().returnValue;
}

}
