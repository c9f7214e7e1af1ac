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

#include "StackTrace.h"
#include "Preprocessor.h"

#include <stdexcept>
#include <iostream>
#include <string>


namespace cdcb::utils {

std::string composeErrorString(const char *file, size_t line, const std::string &what);


/**
 * @brief Base of all exceptions thrown by CdcBench.
 * @details Appends the source location to the message and records the stack trace at the point of construction.
 */
template<class BaseError>
class CdcbError : public BaseError
{
	public:
		CdcbError(const char *file, size_t line, const std::string &what) :
				BaseError(composeErrorString(file, line, what)) {

			m_trace.record(20, 1);
		}
		inline const StackTrace &getStackTrace() const { return m_trace; }
	protected:
		StackTrace m_trace;
};

extern template class CdcbError<std::logic_error>;
extern template class CdcbError<std::runtime_error>;


/// Broken invariant inside the harness or the simulation kernel.
class InternalError : public CdcbError<std::logic_error>
{
	public:
		InternalError(const char *file, size_t line, const std::string &what);
		~InternalError();
};


/// Misuse of the harness, e.g. an invalid configuration or calling operations out of order.
class DesignError : public CdcbError<std::runtime_error>
{
	public:
		DesignError(const char *file, size_t line, const std::string &what);
		~DesignError();
};


template<class BaseError>
std::ostream &operator<<(std::ostream &stream, const CdcbError<BaseError> &exception) {
	stream
		<< exception.what() << std::endl
		<< "Stack trace: " << std::endl
		<< exception.getStackTrace();

	return stream;
}

}
