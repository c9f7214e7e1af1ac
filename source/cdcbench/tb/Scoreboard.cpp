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
#include "cdcbench/pch.h"
#include "Scoreboard.h"
#include "VerificationErrors.h"

#include "../debug/DebugInterface.h"

#include <boost/format.hpp>

namespace cdcb::tb {

using dbg::LogMessage;

std::ostream &operator<<(std::ostream &stream, const ScoreboardReport &report)
{
	stream
		<< (report.passed() ? "PASSED" : "FAILED")
		<< ": " << report.acceptedWrites << " writes, " << report.acceptedReads << " reads, "
		<< report.resets << " resets, " << report.pending << " pending";
	if (report.protocolViolation)
		stream << ", protocol violated";
	stream << std::endl;

	for (const auto &mismatch : report.mismatches)
		stream << boost::format("  read #%d: expected %s, observed %s\n") % mismatch.index % dbg::hexByte(mismatch.expected) % dbg::hexByte(mismatch.observed);

	return stream;
}

void Scoreboard::write(const Event &event)
{
	switch (event.kind) {
		case Event::WRITE:
			m_reference.push_back(event.data);
			m_report.acceptedWrites++;
		break;
		case Event::READ:
			checkRead(event.data);
		break;
		case Event::RESET:
			if (!m_reference.empty())
				dbg::log(LogMessage() << LogMessage::LOG_INFO << LogMessage::LOG_SCOREBOARD << "Reset discards " << m_reference.size() << " pending entries");
			m_reference.clear();
			m_report.resets++;
		break;
	}
}

void Scoreboard::checkRead(std::uint8_t observed)
{
	size_t index = m_report.acceptedReads++;
	m_readHistory.push_back(observed);

	if (m_reference.empty()) {
		m_report.protocolViolation = true;
		std::string msg = "Read #" + std::to_string(index) + " returned " + dbg::hexByte(observed) + " although no write is pending";
		dbg::log(LogMessage() << LogMessage::LOG_ERROR << LogMessage::LOG_SCOREBOARD << msg);
		throw ProtocolViolation(__FILE__, __LINE__, msg);
	}

	std::uint8_t expected = m_reference.front();
	m_reference.pop_front();

	if (expected != observed) {
		m_report.mismatches.push_back({ index, expected, observed });
		dbg::log(LogMessage() << LogMessage::LOG_ERROR << LogMessage::LOG_SCOREBOARD
			<< "Read #" << index << " mismatch: expected " << dbg::hexByte(expected) << ", observed " << dbg::hexByte(observed));
	}
}

SimProcess Scoreboard::run(EventChannel &events)
{
	m_stopRequested = false;
	while (!m_stopRequested) {
		Event event = co_await events.pop();
		write(event);
	}
}

ScoreboardReport Scoreboard::report() const
{
	ScoreboardReport report = m_report;
	report.pending = m_reference.size();
	return report;
}

}
