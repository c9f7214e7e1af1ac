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
#include "Transaction.h"

#include "../debug/DebugInterface.h"
#include "../utils/Exceptions.h"

#include <boost/spirit/home/x3.hpp>

namespace cdcb::tb {

Transaction Transaction::parse(std::string_view text)
{
	namespace x3 = boost::spirit::x3;

	std::string kind;
	std::optional<std::uint64_t> payload;

	auto setKind = [&](auto &ctx) { kind = x3::_attr(ctx); };
	auto setPayload = [&](auto &ctx) { payload = x3::_attr(ctx); };

	auto hex = x3::uint_parser<std::uint64_t, 16>{};
	auto dec = x3::uint_parser<std::uint64_t, 10>{};
	auto number = x3::lexeme[x3::no_case[x3::lit("0x")] >> hex[setPayload]] | dec[setPayload];
	auto grammar = x3::lexeme[+x3::alpha][setKind] >> -number;

	auto first = text.begin();
	bool valid = x3::phrase_parse(first, text.end(), grammar, x3::space);
	CDCB_DESIGNCHECK_HINT(valid && first == text.end(), "Malformed transaction '" + std::string(text) + "', expected 'write <byte>' or 'read'");

	if (kind == "write") {
		CDCB_DESIGNCHECK_HINT(payload, "Write transaction '" + std::string(text) + "' lacks a payload");
		CDCB_DESIGNCHECK_HINT(*payload <= 0xFF, "Payload of '" + std::string(text) + "' does not fit into a byte");
		return write((std::uint8_t) *payload);
	}
	if (kind == "read") {
		CDCB_DESIGNCHECK_HINT(!payload, "Read transaction '" + std::string(text) + "' can not carry a payload");
		return read();
	}
	throw utils::DesignError(__FILE__, __LINE__, "Unknown transaction kind '" + kind + "', expected 'write' or 'read'");
}

std::uint8_t Transaction::payload() const
{
	CDCB_DESIGNCHECK_HINT(isWrite(), "Only write transactions carry a payload");
	return std::get<Write>(m_operation).payload;
}

std::string Transaction::toString() const
{
	if (isWrite())
		return "write " + dbg::hexByte(payload());
	return "read";
}

std::ostream &operator<<(std::ostream &stream, const Transaction &transaction)
{
	return stream << transaction.toString();
}

}
