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
#include "WaitStable.h"

#include "../Simulator.h"

namespace cdcb::sim {

void WaitStable::await_suspend(std::coroutine_handle<> handle)
{
	auto *simulator = Simulator::current();
	CDCB_DESIGNCHECK_HINT(simulator != nullptr, "WaitStable can only be awaited from within a running simulation");
	simulator->simulationProcessSuspending(handle, *this);
}

}
