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
#include "VerificationErrors.h"

namespace cdcb::tb {

VerificationError::VerificationError(const char *file, size_t line, const std::string &what) : utils::CdcbError<std::runtime_error>(file, line, what) { }
ProtocolViolation::ProtocolViolation(const char *file, size_t line, const std::string &what) : VerificationError(file, line, what) { }
LivenessTimeout::LivenessTimeout(const char *file, size_t line, const std::string &what) : VerificationError(file, line, what) { }

}
