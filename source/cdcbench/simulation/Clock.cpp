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
#include "Clock.h"

#include "../utils/Exceptions.h"

namespace cdcb::sim {

ClockDomain::ClockDomain(size_t index, ClockConfig config) : m_index(index), m_config(std::move(config))
{
	CDCB_DESIGNCHECK_HINT(m_config.period != SimTime(), "Clock " + m_config.name + " needs a non zero period");
	CDCB_DESIGNCHECK_HINT(!m_config.name.empty(), "Clocks must be named");
}

}
