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
#include <fstream>
#include <functional>
#include <string>
#include <string_view>

namespace cdcb::sim
{
	/**
	 * @brief Low level writer for value change dump files with a timescale of 1ps.
	 */
	class VCDWriter
	{
	public:
		class Scope
		{
		public:
			Scope(std::function<void()> exitFunc) : m_endScope(exitFunc) {}
			~Scope() { m_endScope(); }
		private:
			std::function<void()> m_endScope;
		};

		VCDWriter(std::string filename);

		explicit operator bool () const { return (bool)m_file; }

		Scope beginModule(std::string_view name);
		void declareWire(size_t width, std::string_view code, std::string_view label);

		Scope beginDumpVars();
		void writeState(std::string_view code, size_t size, bool defined, std::uint64_t value);
		void writeBitState(std::string_view code, bool defined, bool value);
		void writeTime(std::uint64_t time);

		void flush() { m_file.flush(); }
	protected:
		std::ofstream m_file;
		std::string m_fileName;
		bool m_endDefinitions = false;
	};
}
