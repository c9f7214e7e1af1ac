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

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cdcb {

namespace sim {
	class ClockDomain;
}

namespace dbg {

/**
 * @brief Helper class for composing logging messages.
 * @details Similarly to std::ostream, it uses the << operator to concatenate message parts.
 * Message parts can refer to clock domains so that backends can render the domain together with its current edge count.
 *
 * A common use case is `log(LogMessage(clock) << LogMessage::LOG_ERROR << LogMessage::LOG_SCOREBOARD << "Read data mismatch at index " << idx);`
 */
class LogMessage
{
	public:
		enum Severity {
			LOG_INFO,
			LOG_WARNING,
			LOG_ERROR
		};

		enum Source {
			LOG_SIMULATION,
			LOG_STIMULUS,
			LOG_MONITOR,
			LOG_SCOREBOARD,
			LOG_RESET,
			LOG_DEVICE
		};

		struct Anchor {
			const sim::ClockDomain *clock;
		};

		/// Creates an empty log message
		LogMessage();
		/// Same as `LogMessage() << Anchor(anchor)`
		LogMessage(const sim::ClockDomain *anchor);
		/// Same as `LogMessage() << c`
		LogMessage(const char *c);

		/// Sets the severity of the log message
		LogMessage &operator<<(Severity s) { m_severity = s; return *this; }
		/// Sets the origin of the log message
		LogMessage &operator<<(Source s) { m_source = s; return *this; }
		/// Sets a clock domain as the context of this message, backends print its current edge.
		LogMessage &operator<<(Anchor a) { m_anchor = a.clock; return *this; }

		/// Adds a string message part
		LogMessage &operator<<(const char *c) { m_messageParts.push_back(c); return *this; }
		/// Adds a string message part
		LogMessage &operator<<(std::string s) { m_messageParts.push_back(std::move(s)); return *this; }
		/// Adds a string message part
		LogMessage &operator<<(std::string_view s) { m_messageParts.push_back(std::string(s)); return *this; }
		/// Adds a reference to a clock domain, rendered by name.
		LogMessage &operator<<(const sim::ClockDomain *clock) { m_messageParts.push_back(clock); return *this; }

		/// Adds an integer number to the message
		LogMessage &operator<<(std::size_t v) { m_messageParts.push_back(std::to_string(v)); return *this; }

		Severity severity() const { return m_severity; }
		Source source() const { return m_source; }

		const auto &parts() const { return m_messageParts; }
		const sim::ClockDomain *anchor() const { return m_anchor; }

		/// Concatenates all parts into plain text.
		std::string text() const;
	protected:
		Severity m_severity = LOG_INFO;
		Source m_source = LOG_SIMULATION;
		const sim::ClockDomain *m_anchor = nullptr;

		std::vector<std::variant<const char*, std::string, const sim::ClockDomain*>> m_messageParts;
};

/// Formats a byte as 0x.. for log messages.
std::string hexByte(std::uint8_t value);

const char *toString(LogMessage::Severity severity);
const char *toString(LogMessage::Source source);

/**
 * @brief Common interface that all logging backends must implement.
 * @details Also serves as the default implementation that silently ignores all log messages.
 */
class DebugInterface
{
	public:
		virtual ~DebugInterface() = default;

		thread_local static std::unique_ptr<DebugInterface> instance;

		virtual void log(LogMessage msg) { }
		virtual std::string howToReachLog() { return "Logging disabled! Rerun with a call to e.g. cdcb::dbg::logConsole."; }
};

/**
 * @brief Logging backend that writes one line per message to a stream.
 * @details Lines look like `[  140000 ps] WARNING scoreboard   clk_rd#10: message`.
 * Messages below the minimum severity are dropped.
 */
class StreamLog : public DebugInterface
{
	public:
		StreamLog(std::ostream &stream, LogMessage::Severity minSeverity);

		virtual void log(LogMessage msg) override;
		virtual std::string howToReachLog() override { return "Log is written to the console."; }

		LogMessage::Severity minSeverity() const { return m_minSeverity; }
	protected:
		std::ostream &m_stream;
		LogMessage::Severity m_minSeverity;
};

/// Initialize logging to print to std::cout.
void logConsole(LogMessage::Severity minSeverity = LogMessage::LOG_INFO);
/// Initialize logging to print to the given stream which must outlive the logging backend.
void logToStream(std::ostream &stream, LogMessage::Severity minSeverity = LogMessage::LOG_INFO);
/// Drop all further log messages.
void logNothing();

/// Log a message to whatever backend has been initialized.
void log(const LogMessage &msg);
/// Print a short, human readable description of how the log can be accessed.
std::string howToReachLog();

}

}
