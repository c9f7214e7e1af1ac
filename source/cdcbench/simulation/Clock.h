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

#include "SimTime.h"

#include <cstddef>
#include <string>

namespace cdcb::sim {

struct ClockConfig
{
	std::string name;
	SimTime period = nanoseconds(10);
	/// Offset of the edge grid. Edge k (k >= 1) happens at phase + k*period.
	SimTime phase;
};

/**
 * @brief A free running clock that produces an unbounded, strictly increasing sequence of rising edges.
 * @details Clock domains are created by and owned by the Simulator. Two domains have no relationship other
 * than both being advanced by the same simulation time.
 */
class ClockDomain
{
	public:
		ClockDomain(size_t index, ClockConfig config);

		const std::string &name() const { return m_config.name; }
		const SimTime &period() const { return m_config.period; }
		const SimTime &phase() const { return m_config.phase; }

		/// Number of edges that have occurred so far. Zero until the first edge.
		size_t edgeCount() const { return m_edgeCount; }
		SimTime timeOfEdge(size_t edge) const { return m_config.phase + m_config.period * SimTime(edge); }

		size_t index() const { return m_index; }
	protected:
		friend class Simulator;

		size_t m_index;
		ClockConfig m_config;
		size_t m_edgeCount = 0;
};

}
