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

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace cdcb::tb {

/**
 * @brief One intended operation on the FIFO.
 * @details Immutable after construction. Either a write carrying a payload byte or a read without payload.
 */
class Transaction
{
	public:
		struct Write {
			std::uint8_t payload;
			bool operator==(const Write &) const = default;
		};
		struct Read {
			bool operator==(const Read &) const = default;
		};
		using Operation = std::variant<Write, Read>;

		static Transaction write(std::uint8_t payload) { return Transaction(Write{ payload }); }
		static Transaction read() { return Transaction(Read{}); }

		/**
		 * @brief Parses "write <byte>" or "read".
		 * @details The payload can be given in decimal or as 0x prefixed hex number. Throws a DesignError for
		 * unknown kinds, missing or out of range payloads.
		 */
		static Transaction parse(std::string_view text);

		bool isWrite() const { return std::holds_alternative<Write>(m_operation); }
		bool isRead() const { return std::holds_alternative<Read>(m_operation); }
		/// Only valid for writes.
		std::uint8_t payload() const;

		const Operation &operation() const { return m_operation; }

		bool operator==(const Transaction &) const = default;

		std::string toString() const;
	protected:
		explicit Transaction(Operation operation) : m_operation(operation) { }

		Operation m_operation;
};

std::ostream &operator<<(std::ostream &stream, const Transaction &transaction);

}
