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
#include "SimulationProcess.h"

namespace cdcb::sim {

thread_local SimulationCoroutineHandler *SimulationCoroutineHandler::activeHandler = nullptr;

SimulationCoroutineHandler::~SimulationCoroutineHandler()
{
	stopAll();
}

void SimulationCoroutineHandler::stopAll()
{
	auto lastHandler = activeHandler;
	activeHandler = this;
	while (!m_coroutinesReadyToResume.empty())
		m_coroutinesReadyToResume.pop();
	m_simulationCoroutines.clear();
	activeHandler = lastHandler;
}

void SimulationCoroutineHandler::run()
{
	auto lastHandler = activeHandler;
	activeHandler = this;
	try {
		while (!m_coroutinesReadyToResume.empty()) {
			auto handle = m_coroutinesReadyToResume.front();
			m_coroutinesReadyToResume.pop();
			handle.resume();
		}
	} catch (...) {
		activeHandler = lastHandler;
		throw;
	}
	activeHandler = lastHandler;
}

void SimulationCoroutineHandler::coroutineFinalSuspending(std::coroutine_handle<> handle)
{
	auto it = m_simulationCoroutines.find(handle.address());
	if (it == m_simulationCoroutines.end())
		return;

	// Move the reference out before erasing, the frame may be destroyed and its destruction must not observe a half erased map.
	internal::CoroutineRef ref = std::move(it->second);
	m_simulationCoroutines.erase(it);
}

template class SimulationFunction<void>;
template class SimulationFunction<bool>;

}
