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

#include <coroutine>

namespace cdcb::sim {

class ClockDomain;

/**
 * @brief co_awaiting on a WaitClock continues the simulation until the next edge of the clock.
 * @details The coroutine resumes after all clocked components have processed the edge, so it sees the
 * new register values and everything it drives is sampled at the following edge.
 * Repeatedly co_awaiting a clock advances in clock ticks.
 */
class WaitClock {
	public:
		WaitClock(const ClockDomain &clock);

		bool await_ready() noexcept { return false; } // always force reevaluation
		void await_suspend(std::coroutine_handle<> handle);
		void await_resume() noexcept { }

		const ClockDomain &getClock() const { return m_clock; }
	protected:
		const ClockDomain &m_clock;
};

/// Returns an awaitable that suspends until the next edge of the given clock.
inline WaitClock OnClk(const ClockDomain &clock) { return WaitClock(clock); }

}
