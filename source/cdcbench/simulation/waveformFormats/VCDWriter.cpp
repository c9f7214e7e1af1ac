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
#include "VCDWriter.h"
#include "../../utils/Exceptions.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>

namespace cdcb::sim {

VCDWriter::VCDWriter(std::string filename) :
	m_fileName(std::move(filename))
{
	auto parentPath = std::filesystem::path(m_fileName).parent_path();
	if (!parentPath.empty())
		std::filesystem::create_directories(parentPath);

	m_file.open(m_fileName, std::ofstream::binary);
	CDCB_DESIGNCHECK_HINT(m_file, "Could not open " + m_fileName + " for writing");

	auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	tm now_tb;
	localtime_r(&now, &now_tb);

	m_file
		<< "$date\n" << std::put_time(&now_tb, "%Y-%m-%d %X") << "\n$end\n"
		<< "$version\nCdcBench simulation output\n$end\n"
		<< "$timescale\n1ps\n$end\n";
}

VCDWriter::Scope VCDWriter::beginModule(std::string_view name)
{
	CDCB_ASSERT(!name.empty());
	CDCB_ASSERT(!m_endDefinitions);
	m_file << "$scope module " << name << " $end\n";

	return Scope([this]() {
		m_file << "$upscope $end\n";
	});
}

void VCDWriter::declareWire(size_t width, std::string_view code, std::string_view label)
{
	CDCB_ASSERT(!m_endDefinitions);
	m_file << "$var wire " << width << " " << code << " " << label << " $end\n";
}

VCDWriter::Scope VCDWriter::beginDumpVars()
{
	CDCB_ASSERT(!m_endDefinitions);
	m_file
		<< "$enddefinitions $end\n"
		<< "$dumpvars\n";
	m_endDefinitions = true;

	return Scope([this]() {
		m_file << "$end\n";
	});
}

void VCDWriter::writeState(std::string_view code, size_t size, bool defined, std::uint64_t value)
{
	CDCB_ASSERT(m_endDefinitions);

	m_file << 'b';
	for (size_t i = 0; i < size; i++) {
		auto bitIdx = size - 1 - i;
		if (!defined)
			m_file << 'X';
		else if ((value >> bitIdx) & 1)
			m_file << '1';
		else
			m_file << '0';
	}
	m_file << ' ' << code << '\n';
}

void VCDWriter::writeBitState(std::string_view code, bool defined, bool value)
{
	CDCB_ASSERT(m_endDefinitions);

	if (!defined)
		m_file << 'X';
	else if (value)
		m_file << '1';
	else
		m_file << '0';
	m_file << code << '\n';
}

void VCDWriter::writeTime(std::uint64_t time)
{
	m_file << '#' << time << '\n';
}

}
