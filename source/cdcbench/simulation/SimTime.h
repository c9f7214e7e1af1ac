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

#include <boost/rational.hpp>

#include <cstdint>

namespace cdcb::sim {

/// Simulation time in seconds, relative to power on.
using SimTime = boost::rational<std::uint64_t>;

inline SimTime nanoseconds(std::uint64_t ns) { return SimTime(ns, 1'000'000'000ull); }
inline SimTime picoseconds(std::uint64_t ps) { return SimTime(ps, 1'000'000'000'000ull); }

/// Converts to whole picoseconds, rounding down.
inline std::uint64_t toPicoseconds(const SimTime &time) {
	SimTime scaled = time * SimTime(1'000'000'000'000ull);
	return scaled.numerator() / scaled.denominator();
}

}
