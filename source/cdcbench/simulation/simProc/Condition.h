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
#include <queue>
#include <utility>

namespace cdcb::sim {

class SimulationCoroutineHandler;

/**
 * @brief Condition variable similar to std::condition_variable which allows simulation coroutines to synchronize each other.
 * @details Notifying does not resume waiting coroutines directly but schedules them on the handler they suspended in.
 * A woken coroutine must re-check its predicate.
 */
class Condition
{
	public:
		struct ConditionAwaitable {
			Condition &condition;

			ConditionAwaitable(Condition &condition) : condition(condition) { }

			bool await_ready() noexcept { return false; }
			void await_resume() noexcept {}
			void await_suspend(std::coroutine_handle<> callingSimulationCoroutine);
		};

		/// Schedules one simulation coroutine that is waiting on this condition to resume (if any is waiting).
		inline void notify_one() { notify_oldest(); }

		/// Schedules the oldest simulation coroutine that is waiting on this condition (the one that has been waiting the longest) to resume (if any is waiting).
		void notify_oldest();
		/// Schedules all simulation coroutines that are waiting on this condition to resume.
		void notify_all();

		/// Suspends execution of the calling (co_awaiting) coroutine.
		ConditionAwaitable wait() { return {*this}; }

		size_t numWaiting() const { return m_awaitingCoroutines.size(); }
	protected:
		std::queue<std::pair<SimulationCoroutineHandler*, std::coroutine_handle<>>> m_awaitingCoroutines;

		friend struct ConditionAwaitable;
};

}
