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
#include "SimulatorCallbacks.h"

#include <algorithm>

namespace cdcb::sim {

void CallbackDispatcher::removeCallbacks(SimulatorCallbacks *c)
{
	std::erase(m_callbacks, c);
}

void CallbackDispatcher::onPowerOn() { for (auto *c : m_callbacks) c->onPowerOn(); }
void CallbackDispatcher::onCommitState() { for (auto *c : m_callbacks) c->onCommitState(); }
void CallbackDispatcher::onNewTick(const SimTime &simulationTime) { for (auto *c : m_callbacks) c->onNewTick(simulationTime); }
void CallbackDispatcher::onClock(const ClockDomain &clock) { for (auto *c : m_callbacks) c->onClock(clock); }
void CallbackDispatcher::onPinDriven(const PinBase &pin) { for (auto *c : m_callbacks) c->onPinDriven(pin); }

void CallbackDispatcher::onDebugMessage(std::string msg) { for (auto *c : m_callbacks) c->onDebugMessage(msg); }
void CallbackDispatcher::onWarning(std::string msg) { for (auto *c : m_callbacks) c->onWarning(msg); }
void CallbackDispatcher::onAssert(std::string msg) { for (auto *c : m_callbacks) c->onAssert(msg); }

}
