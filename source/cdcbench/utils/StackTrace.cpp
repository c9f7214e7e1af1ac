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
#include "StackTrace.h"

#include <boost/format.hpp>

namespace cdcb::utils
{
	namespace {
		std::string formatFrame(const boost::stacktrace::frame &frame)
		{
			return (boost::format("%s at %s:%d") % frame.name() % frame.source_file() % frame.source_line()).str();
		}

		bool isKernelFrame(const std::string &formatted)
		{
			for (std::string_view prefix : { "boost::", "std::", "cdcb::sim::", "cdcb::utils::" })
				if (formatted.starts_with(prefix))
					return true;
			return false;
		}
	}

	void StackTrace::record(size_t size, size_t skipTop)
	{
		boost::stacktrace::stacktrace trace(skipTop + 1, size);

		m_trace.clear();
		m_trace.reserve(trace.size());
		for (const auto &frame : trace)
			m_trace.push_back(frame);
	}

	std::vector<std::string> StackTrace::formatEntries() const
	{
		std::vector<std::string> result;
		result.reserve(m_trace.size());
		for (const auto &frame : m_trace)
			result.push_back(formatFrame(frame));
		return result;
	}

	std::vector<std::string> StackTrace::formatEntriesFiltered() const
	{
		std::vector<std::string> result;
		for (const auto &frame : m_trace) {
			std::string formatted = formatFrame(frame);
			if (isKernelFrame(formatted))
				continue;
			result.emplace_back(std::move(formatted));
		}

		while (!result.empty() && !result.back().starts_with("main "))
			result.pop_back();

		return result;
	}

	std::ostream &operator<<(std::ostream &stream, const StackTrace &trace)
	{
		auto symbols = trace.formatEntries();
		for (size_t i = 0; i < symbols.size(); i++)
			stream << "	" << i << ": " << symbols[i] << std::endl;

		return stream;
	}
}
