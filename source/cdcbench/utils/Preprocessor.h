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

#include <iostream>

#if defined(_MSC_VER)

#define GET_FUNCTION_NAME __FUNCSIG__

#elif defined(__GNUC__)

#define GET_FUNCTION_NAME __PRETTY_FUNCTION__

#else
#error "Unsupported platform!"
#endif


#define CDCB_ASSERT(x) { if (!(x)) { throw cdcb::utils::InternalError(__FILE__, __LINE__, std::string("Assertion failed: ") + #x); }}
#define CDCB_ASSERT_HINT(x, message) { if (!(x)) { throw cdcb::utils::InternalError(__FILE__, __LINE__, std::string("Assertion failed: ") + #x + " Hint: " + message); }}


#define CDCB_DESIGNCHECK(x) { if (!(x)) { throw cdcb::utils::DesignError(__FILE__, __LINE__, std::string("Usage check failed: ") + #x); }}
#define CDCB_DESIGNCHECK_HINT(x, message) { if (!(x)) { throw cdcb::utils::DesignError(__FILE__, __LINE__, std::string("Usage check failed: ") + #x + " Hint: " + message); }}
