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
#include "DebugInterface.h"

#include "../simulation/Clock.h"
#include "../simulation/Simulator.h"

#include <boost/format.hpp>

namespace cdcb::dbg {

thread_local std::unique_ptr<DebugInterface> DebugInterface::instance = std::make_unique<DebugInterface>();

LogMessage::LogMessage() { }
LogMessage::LogMessage(const sim::ClockDomain *anchor) : m_anchor(anchor) { }
LogMessage::LogMessage(const char *c) { (*this) << c; }

std::string LogMessage::text() const
{
	std::string result;
	for (const auto &part : m_messageParts) {
		if (std::holds_alternative<const char*>(part))
			result += std::get<const char*>(part);
		else if (std::holds_alternative<std::string>(part))
			result += std::get<std::string>(part);
		else
			result += std::get<const sim::ClockDomain*>(part)->name();
	}
	return result;
}

std::string hexByte(std::uint8_t value)
{
	return (boost::format("0x%02x") % (unsigned) value).str();
}

const char *toString(LogMessage::Severity severity)
{
	switch (severity) {
		case LogMessage::LOG_INFO: return "INFO";
		case LogMessage::LOG_WARNING: return "WARNING";
		case LogMessage::LOG_ERROR: return "ERROR";
	}
	return "?";
}

const char *toString(LogMessage::Source source)
{
	switch (source) {
		case LogMessage::LOG_SIMULATION: return "simulation";
		case LogMessage::LOG_STIMULUS: return "stimulus";
		case LogMessage::LOG_MONITOR: return "monitor";
		case LogMessage::LOG_SCOREBOARD: return "scoreboard";
		case LogMessage::LOG_RESET: return "reset";
		case LogMessage::LOG_DEVICE: return "device";
	}
	return "?";
}


StreamLog::StreamLog(std::ostream &stream, LogMessage::Severity minSeverity) : m_stream(stream), m_minSeverity(minSeverity)
{
}

void StreamLog::log(LogMessage msg)
{
	if (msg.severity() < m_minSeverity)
		return;

	if (auto *simulator = sim::Simulator::current())
		m_stream << boost::format("[%10d ps] ") % sim::toPicoseconds(simulator->getCurrentSimulationTime());

	m_stream << boost::format("%-7s %-10s ") % toString(msg.severity()) % toString(msg.source());

	if (msg.anchor())
		m_stream << msg.anchor()->name() << '#' << msg.anchor()->edgeCount() << ": ";

	m_stream << msg.text() << std::endl;
}


void logConsole(LogMessage::Severity minSeverity)
{
	DebugInterface::instance = std::make_unique<StreamLog>(std::cout, minSeverity);
}

void logToStream(std::ostream &stream, LogMessage::Severity minSeverity)
{
	DebugInterface::instance = std::make_unique<StreamLog>(stream, minSeverity);
}

void logNothing()
{
	DebugInterface::instance = std::make_unique<DebugInterface>();
}

void log(const LogMessage &msg)
{
	DebugInterface::instance->log(msg);
}

std::string howToReachLog()
{
	return DebugInterface::instance->howToReachLog();
}

}
