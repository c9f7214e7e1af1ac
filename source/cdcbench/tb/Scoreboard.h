/*  This file is part of CdcBench, a verification harness for clock domain crossing FIFOs.
	Copyright (C) 2026 The CdcBench contributors

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

#include "Event.h"

#include "../simulation/simProc/SimulationProcess.h"

#include <cstdint>
#include <deque>
#include <ostream>
#include <vector>

namespace cdcb::tb {

struct Mismatch
{
	/// Position of the read among all reads since the start of the run.
	size_t index;
	std::uint8_t expected;
	std::uint8_t observed;

	bool operator==(const Mismatch &) const = default;
};

struct ScoreboardReport
{
	size_t acceptedWrites = 0;
	size_t acceptedReads = 0;
	size_t resets = 0;
	/// Entries written but not yet read at the time of the report.
	size_t pending = 0;
	std::vector<Mismatch> mismatches;
	bool protocolViolation = false;

	bool passed() const { return mismatches.empty() && !protocolViolation; }
};

std::ostream &operator<<(std::ostream &stream, const ScoreboardReport &report);

/**
 * @brief Reference model of the FIFO contents.
 * @details Writes are appended to a reference queue, reads are checked against its head. Events are paired by order only,
 * never by time, so the two monitor streams do not need to be in lockstep.
 * A read with nothing pending is a ProtocolViolation and aborts the run. Data mismatches are logged and accumulated.
 * A reset event discards all pending entries.
 */
class Scoreboard
{
	public:
		/// Checks one event.
		void write(const Event &event);

		/// Consumes events from the channel until stop() is requested.
		SimProcess run(EventChannel &events);
		void stop() { m_stopRequested = true; }

		const std::deque<std::uint8_t> &referenceQueue() const { return m_reference; }
		size_t pending() const { return m_reference.size(); }
		const std::vector<std::uint8_t> &readHistory() const { return m_readHistory; }
		const std::vector<Mismatch> &mismatches() const { return m_report.mismatches; }

		ScoreboardReport report() const;
		bool passed() const { return m_report.passed(); }
	protected:
		std::deque<std::uint8_t> m_reference;
		std::vector<std::uint8_t> m_readHistory;
		ScoreboardReport m_report;
		bool m_stopRequested = false;

		void checkRead(std::uint8_t observed);
};

}
