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

#include "../utils/Exceptions.h"

#include <stdexcept>
#include <string>

namespace cdcb::tb {

/// Base of all failures in which the device did not behave as required.
class VerificationError : public utils::CdcbError<std::runtime_error>
{
	public:
		VerificationError(const char *file, size_t line, const std::string &what);
};

/// The device completed a transfer that the reference model can not account for, e.g. a read from an empty FIFO.
class ProtocolViolation : public VerificationError
{
	public:
		ProtocolViolation(const char *file, size_t line, const std::string &what);
};

/// A readiness flag did not clear within the allowed number of clock edges.
class LivenessTimeout : public VerificationError
{
	public:
		LivenessTimeout(const char *file, size_t line, const std::string &what);
};

}
