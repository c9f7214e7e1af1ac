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

/**
 * @brief co_awaiting a WaitStable suspends until all processes of the current time step have run.
 * @details The coroutine resumes in the read-only phase of the same time step. It can sample settled values
 * but must not drive pins until it awaits a clock again.
 */
class WaitStable {
	public:
		bool await_ready() noexcept { return false; }
		void await_suspend(std::coroutine_handle<> handle);
		void await_resume() noexcept { }
};

}
