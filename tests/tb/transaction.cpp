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
#include "tb/pch.h"

#include <boost/test/unit_test.hpp>

#include <cstdlib>
#include <string>
#include <vector>

using namespace boost::unit_test;
using namespace cdcb;
using namespace cdcb::tb;

BOOST_AUTO_TEST_CASE(Transaction_Parse)
{
	BOOST_TEST(Transaction::parse("write 0x11") == Transaction::write(0x11));
	BOOST_TEST(Transaction::parse("write 17") == Transaction::write(17));
	BOOST_TEST(Transaction::parse("write 0XfF") == Transaction::write(0xFF));
	BOOST_TEST(Transaction::parse("  write   0  ") == Transaction::write(0));
	BOOST_TEST(Transaction::parse("read") == Transaction::read());
	BOOST_TEST(Transaction::parse(" read ") == Transaction::read());
}

BOOST_AUTO_TEST_CASE(Transaction_ParseRejectsMalformed)
{
	BOOST_CHECK_THROW(Transaction::parse(""), cdcb::utils::DesignError);
	BOOST_CHECK_THROW(Transaction::parse("push 1"), cdcb::utils::DesignError);
	BOOST_CHECK_THROW(Transaction::parse("write"), cdcb::utils::DesignError);
	BOOST_CHECK_THROW(Transaction::parse("write 256"), cdcb::utils::DesignError);
	BOOST_CHECK_THROW(Transaction::parse("write 0x1g"), cdcb::utils::DesignError);
	BOOST_CHECK_THROW(Transaction::parse("write -1"), cdcb::utils::DesignError);
	BOOST_CHECK_THROW(Transaction::parse("read 3"), cdcb::utils::DesignError);
}

BOOST_AUTO_TEST_CASE(Transaction_Accessors)
{
	auto write = Transaction::write(0x2a);
	BOOST_TEST(write.isWrite());
	BOOST_TEST(!write.isRead());
	BOOST_TEST(write.payload() == 0x2a);
	BOOST_TEST(write.toString() == "write 0x2a");

	auto read = Transaction::read();
	BOOST_TEST(read.isRead());
	BOOST_TEST(read.toString() == "read");
	BOOST_CHECK_THROW(read.payload(), cdcb::utils::DesignError);

	BOOST_TEST(!(write == read));
	BOOST_TEST(!(write == Transaction::write(0x2b)));
}

BOOST_AUTO_TEST_CASE(Sequences_WriteThenRead)
{
	std::vector<std::uint8_t> values = { 1, 2, 3 };
	auto transactions = sequences::writeThenRead(values);

	BOOST_REQUIRE(transactions.size() == 6);
	for (size_t i = 0; i < 3; i++) {
		BOOST_TEST(transactions[i] == Transaction::write(values[i]));
		BOOST_TEST(transactions[3 + i].isRead());
	}
	BOOST_TEST(sequences::payloads(transactions) == values, boost::test_tools::per_element());
	BOOST_TEST(sequences::reads(4).size() == 4u);
}

BOOST_AUTO_TEST_CASE(Sequences_RandomChunks)
{
	auto transactions = sequences::randomChunks(10, 4, 1);

	// Chunks of 4, 4 and 2 writes, each followed by as many reads.
	std::string pattern;
	for (const auto &t : transactions)
		pattern += t.isWrite() ? 'W' : 'R';
	BOOST_TEST(pattern == "WWWWRRRRWWWWRRRRWWRR");

	BOOST_TEST(sequences::payloads(transactions).size() == 10u);
	BOOST_TEST(sequences::randomChunks(10, 4, 1) == transactions, boost::test_tools::per_element());
	BOOST_TEST((sequences::payloads(sequences::randomChunks(64, 8, 2)) != sequences::payloads(sequences::randomChunks(64, 8, 3))));

	BOOST_CHECK_THROW(sequences::randomChunks(4, 0, 1), cdcb::utils::DesignError);
}

BOOST_AUTO_TEST_CASE(TestbenchConfig_Load)
{
	cdcb::utils::ConfigTree tree;
	tree.loadFromString(R"(
clocks:
  write: { name: wclk, period_ns: 8, phase_ns: 2 }
  read: { period_ns: 20 }
reset:
  hold_edges: 2
  settle_edges: 6
driver:
  max_wait_edges: 50
device:
  depth: 16
  sync_stages: 3
log:
  level: none
waveform:
  vcd: out/run.vcd
sequence:
  - write 0x11
  - read
)");

	TestbenchConfig config;
	config.load(tree);

	BOOST_TEST(config.writeClock.name == "wclk");
	BOOST_TEST(sim::toPicoseconds(config.writeClock.period) == 8'000u);
	BOOST_TEST(sim::toPicoseconds(config.writeClock.phase) == 2'000u);
	BOOST_TEST(config.readClock.name == "clk_rd");
	BOOST_TEST(sim::toPicoseconds(config.readClock.period) == 20'000u);
	BOOST_TEST(config.reset.holdEdges == 2u);
	BOOST_TEST(config.reset.settleEdges == 6u);
	BOOST_TEST(config.maxWaitEdges == 50u);
	BOOST_TEST(config.device.depth == 16u);
	BOOST_TEST(config.device.syncStages == 3u);
	BOOST_TEST(!config.logLevel.has_value());
	BOOST_TEST(config.vcdFile.value_or("") == "out/run.vcd");
	BOOST_REQUIRE(config.sequence.size() == 2);
	BOOST_TEST(config.sequence[0] == Transaction::write(0x11));
	BOOST_TEST(config.sequence[1] == Transaction::read());
}

BOOST_AUTO_TEST_CASE(TestbenchConfig_Defaults)
{
	cdcb::utils::ConfigTree tree;
	tree.loadFromString("{}");

	TestbenchConfig config;
	config.load(tree);

	BOOST_TEST(config.writeClock.name == "clk_wr");
	BOOST_TEST(sim::toPicoseconds(config.writeClock.period) == 10'000u);
	BOOST_TEST(sim::toPicoseconds(config.readClock.period) == 14'000u);
	BOOST_TEST(config.reset.holdEdges == 4u);
	BOOST_TEST(config.reset.settleEdges == 4u);
	BOOST_TEST(config.maxWaitEdges == 1000u);
	BOOST_TEST(config.device.depth == 8u);
	BOOST_TEST((config.logLevel == dbg::LogMessage::LOG_WARNING));
	BOOST_TEST(!config.vcdFile.has_value());
	BOOST_TEST(config.sequence.empty());
}

BOOST_AUTO_TEST_CASE(TestbenchConfig_Invalid)
{
	auto load = [](const char *yaml) {
		cdcb::utils::ConfigTree tree;
		tree.loadFromString(yaml);
		TestbenchConfig config;
		config.load(tree);
	};

	BOOST_CHECK_THROW(load("log: { level: verbose }"), cdcb::utils::DesignError);
	BOOST_CHECK_THROW(load("clocks: { write: { name: clk }, read: { name: clk } }"), cdcb::utils::DesignError);
	BOOST_CHECK_THROW(load("clocks: { write: { period_ns: 0 } }"), cdcb::utils::DesignError);
	BOOST_CHECK_THROW(load("reset: { hold_edges: 0 }"), cdcb::utils::DesignError);
	BOOST_CHECK_THROW(load("sequence: [ 'write 0x100' ]"), cdcb::utils::DesignError);
	BOOST_CHECK_THROW(load("sequence: write 0x10"), cdcb::utils::DesignError);
}

BOOST_AUTO_TEST_CASE(TestbenchConfig_RejectsNegativeSubstitutedBounds)
{
	setenv("CDCB_TEST_MAX_WAIT", "-1", 1);

	cdcb::utils::ConfigTree tree;
	tree.loadFromString("driver: { max_wait_edges: $(CDCB_TEST_MAX_WAIT) }");
	TestbenchConfig config;
	BOOST_CHECK_THROW(config.load(tree), cdcb::utils::DesignError);

	setenv("CDCB_TEST_MAX_WAIT", "25", 1);
	config.load(tree);
	BOOST_TEST(config.maxWaitEdges == 25u);
}
