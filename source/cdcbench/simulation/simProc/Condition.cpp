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
#include "Condition.h"
#include "SimulationProcess.h"

namespace cdcb::sim {

void Condition::ConditionAwaitable::await_suspend(std::coroutine_handle<> callingSimulationCoroutine)
{
	auto *handler = SimulationCoroutineHandler::activeHandler;
	CDCB_ASSERT_HINT(handler != nullptr, "Conditions can only be awaited from within a running simulation process");
	condition.m_awaitingCoroutines.push({ handler, callingSimulationCoroutine });
}

void Condition::notify_oldest()
{
	if (m_awaitingCoroutines.empty())
		return;

	auto [handler, handle] = m_awaitingCoroutines.front();
	m_awaitingCoroutines.pop();
	handler->readyToResume(handle);
}

void Condition::notify_all()
{
	while (!m_awaitingCoroutines.empty())
		notify_oldest();
}

}
