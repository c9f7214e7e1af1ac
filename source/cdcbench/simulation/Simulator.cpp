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
#include "Simulator.h"

#include "Pin.h"
#include "simProc/WaitClock.h"
#include "simProc/WaitStable.h"
#include "../debug/DebugInterface.h"

#include <algorithm>

namespace cdcb::sim {

namespace {
	thread_local Simulator *currentSimulator = nullptr;

	/// Clears the read-only flag even if a process throws.
	class ReadOnlyPhase {
		public:
			ReadOnlyPhase(bool &flag) : m_flag(flag) { m_flag = true; }
			~ReadOnlyPhase() { m_flag = false; }
		protected:
			bool &m_flag;
	};
}

Simulator::ActiveScope::ActiveScope(Simulator &simulator) : m_last(currentSimulator)
{
	currentSimulator = &simulator;
}

Simulator::ActiveScope::~ActiveScope()
{
	currentSimulator = m_last;
}

Simulator *Simulator::current()
{
	return currentSimulator;
}


Simulator::Simulator()
{
}

Simulator::~Simulator()
{
	// Coroutine frames are destroyed with the handler, the handles in the wait lists must not outlive them.
	m_awaitingClock.clear();
	m_awaitingStable.clear();
	m_coroutineHandler.stopAll();
}

ClockDomain &Simulator::createClock(ClockConfig config)
{
	CDCB_DESIGNCHECK_HINT(!m_powerOnCalled, "Clocks must be created before power on");
	for (const auto &clock : m_clocks)
		CDCB_DESIGNCHECK_HINT(clock->name() != config.name, "Clock names must be unique: " + config.name);

	m_clocks.push_back(std::make_unique<ClockDomain>(m_clocks.size(), std::move(config)));
	m_awaitingClock.emplace_back();
	return *m_clocks.back();
}

void Simulator::addClockedComponent(ClockedComponent *component)
{
	CDCB_DESIGNCHECK_HINT(!m_powerOnCalled, "Clocked components must be added before power on");
	m_clockedComponents.push_back(component);
}

void Simulator::addSimulationProcess(std::function<SimProcess()> simProc)
{
	m_simProcs.push_back(std::move(simProc));

	if (m_powerOnCalled) {
		ActiveScope scope(*this);
		m_coroutineHandler.start(m_simProcs.back()());
		runReadyProcesses();
	}
}

void Simulator::powerOn()
{
	CDCB_DESIGNCHECK_HINT(!m_powerOnCalled, "The simulation can only be powered on once");
	ActiveScope scope(*this);

	m_powerOnCalled = true;
	m_simulationTime = SimTime();
	m_phase = TimingPhase::AFTER;

	for (const auto &clock : m_clocks)
		scheduleNextEdge(*clock);

	m_callbackDispatcher.onPowerOn();

	for (auto *component : m_clockedComponents)
		component->onPowerOn();

	for (auto &simProc : m_simProcs)
		m_coroutineHandler.start(simProc());

	runReadyProcesses();
	runStablePhase();

	m_callbackDispatcher.onCommitState();
}

void Simulator::advanceEvent()
{
	CDCB_DESIGNCHECK_HINT(m_powerOnCalled, "The simulation must be powered on before advancing");
	if (m_nextEdges.empty())
		return;

	ActiveScope scope(*this);

	m_simulationTime = m_nextEdges.top().time;
	m_callbackDispatcher.onNewTick(m_simulationTime);

	std::vector<ClockDomain*> activeClocks;
	while (!m_nextEdges.empty() && m_nextEdges.top().time == m_simulationTime) {
		ClockDomain &clock = *m_clocks[m_nextEdges.top().clockIndex];
		m_nextEdges.pop();

		clock.m_edgeCount++;
		scheduleNextEdge(clock);
		activeClocks.push_back(&clock);
	}

	m_phase = TimingPhase::DURING;
	for (auto *clock : activeClocks) {
		m_callbackDispatcher.onClock(*clock);
		for (auto *component : m_clockedComponents)
			component->onClockEdge(*clock);
	}

	m_phase = TimingPhase::AFTER;
	std::vector<AwaitingProcess> resuming;
	for (auto *clock : activeClocks) {
		auto &awaiting = m_awaitingClock[clock->index()];
		resuming.insert(resuming.end(), awaiting.begin(), awaiting.end());
		awaiting.clear();
	}
	std::sort(resuming.begin(), resuming.end(), [](const AwaitingProcess &lhs, const AwaitingProcess &rhs) { return lhs.order < rhs.order; });

	for (const auto &process : resuming)
		m_coroutineHandler.readyToResume(process.handle);
	runReadyProcesses();

	runStablePhase();

	m_callbackDispatcher.onCommitState();
}

void Simulator::advance(const SimTime &duration)
{
	SimTime target = m_simulationTime + duration;
	while (!m_nextEdges.empty() && m_nextEdges.top().time <= target)
		advanceEvent();
	m_simulationTime = target;
}

void Simulator::runEdges(const ClockDomain &clock, size_t numEdges)
{
	CDCB_DESIGNCHECK_HINT(clock.index() < m_clocks.size() && m_clocks[clock.index()].get() == &clock, "The clock " + clock.name() + " belongs to a different simulator");
	if (!m_powerOnCalled)
		powerOn();

	size_t targetEdge = clock.edgeCount() + numEdges;
	while (clock.edgeCount() < targetEdge)
		advanceEvent();
}

void Simulator::onDebugMessage(std::string msg)
{
	m_callbackDispatcher.onDebugMessage(std::move(msg));
}

void Simulator::onWarning(std::string msg)
{
	dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_WARNING << dbg::LogMessage::LOG_SIMULATION << msg);
	m_callbackDispatcher.onWarning(std::move(msg));
}

void Simulator::onAssert(std::string msg)
{
	dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_ERROR << dbg::LogMessage::LOG_SIMULATION << msg);
	m_callbackDispatcher.onAssert(std::move(msg));
}

void Simulator::onPinDriven(const PinBase &pin)
{
	m_callbackDispatcher.onPinDriven(pin);
}

void Simulator::simulationProcessSuspending(std::coroutine_handle<> handle, WaitClock &waitClock)
{
	const ClockDomain &clock = waitClock.getClock();
	CDCB_DESIGNCHECK_HINT(clock.index() < m_clocks.size() && m_clocks[clock.index()].get() == &clock, "The clock " + clock.name() + " belongs to a different simulator");
	m_awaitingClock[clock.index()].push_back({ m_suspendCounter++, handle });
}

void Simulator::simulationProcessSuspending(std::coroutine_handle<> handle, WaitStable &waitStable)
{
	m_awaitingStable.push_back(handle);
}

void Simulator::scheduleNextEdge(const ClockDomain &clock)
{
	m_nextEdges.push({ clock.timeOfEdge(clock.edgeCount() + 1), clock.index() });
}

void Simulator::runReadyProcesses()
{
	m_coroutineHandler.run();
}

void Simulator::runStablePhase()
{
	m_phase = TimingPhase::STABLE;

	std::vector<std::coroutine_handle<>> stable;
	std::swap(stable, m_awaitingStable);

	ReadOnlyPhase readOnly(m_readOnlyMode);
	for (auto handle : stable)
		m_coroutineHandler.readyToResume(handle);
	runReadyProcesses();
}


void pinDrivenByProcess(const PinBase &pin)
{
	CDCB_DESIGNCHECK_HINT(pin.direction() == PinBase::INPUT, "Pin " + pin.name() + " is driven by the device and can not be assigned");

	if (auto *simulator = Simulator::current()) {
		CDCB_DESIGNCHECK_HINT(!simulator->readOnlyMode(), "Pin " + pin.name() + " can not be driven after awaiting WaitStable, await a clock first");
		simulator->onPinDriven(pin);
	}
}

}
