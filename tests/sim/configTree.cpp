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
#include "sim/pch.h"

#include <boost/test/unit_test.hpp>

#include <cstdlib>
#include <string>
#include <vector>

using namespace boost::unit_test;
using namespace cdcb;

BOOST_AUTO_TEST_CASE(ConfigTree_Paths)
{
	cdcb::utils::ConfigTree config;
	config.loadFromString(R"(
clocks:
  write:
    name: wclk
    period_ns: 8
device:
  depth: 16
sequence:
  - write 0x11
  - read
)");

	BOOST_TEST(config["clocks/write/name"].as<std::string>() == "wclk");
	BOOST_TEST(config["clocks/write/period_ns"].as<size_t>() == 8u);
	BOOST_TEST(config["clocks"]["write"]["period_ns"].as<size_t>() == 8u);
	BOOST_TEST(config["device/depth"].as<size_t>(4) == 16u);

	BOOST_TEST(!config["clocks/read"].isDefined());
	BOOST_TEST(config["clocks/read/period_ns"].as<size_t>(14) == 14u);
	BOOST_CHECK_THROW(config["clocks/read/period_ns"].as<size_t>(), cdcb::utils::DesignError);

	auto sequence = config["sequence"];
	BOOST_TEST(sequence.isSequence());
	BOOST_TEST(sequence.size() == 2u);
	BOOST_TEST(sequence[1].as<std::string>() == "read");

	std::vector<std::string> entries;
	for (auto entry : sequence)
		entries.push_back(entry.as<std::string>());
	BOOST_TEST(entries == std::vector<std::string>({ "write 0x11", "read" }), boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(ConfigTree_EnvironmentVariables)
{
	setenv("CDCB_TEST_DEPTH", "32", 1);
	setenv("CDCB_TEST_DIR", "/tmp/cdcbench", 1);

	cdcb::utils::ConfigTree config;
	config.loadFromString(R"(
device:
  depth: $(CDCB_TEST_DEPTH)
waveform:
  vcd: $(CDCB_TEST_DIR)/trace.vcd
missing: $(CDCB_TEST_SURELY_NOT_SET)
)");

	BOOST_TEST(config["device/depth"].as<size_t>() == 32u);
	BOOST_TEST(config["waveform/vcd"].as<std::string>() == "/tmp/cdcbench/trace.vcd");
	BOOST_CHECK_THROW(config["missing"].as<std::string>(), cdcb::utils::DesignError);

	BOOST_TEST(cdcb::utils::replaceEnvVars("plain text") == "plain text");
}

BOOST_AUTO_TEST_CASE(ConfigTree_SubstitutedValuesAreRangeChecked)
{
	setenv("CDCB_TEST_NEGATIVE", "-1", 1);
	setenv("CDCB_TEST_WORD", "eight", 1);
	setenv("CDCB_TEST_FLAG", "true", 1);

	cdcb::utils::ConfigTree config;
	config.loadFromString(R"(
driver:
  max_wait_edges: $(CDCB_TEST_NEGATIVE)
device:
  depth: $(CDCB_TEST_WORD)
waveform:
  enabled: $(CDCB_TEST_FLAG)
)");

	BOOST_CHECK_THROW(config["driver/max_wait_edges"].as<size_t>(), cdcb::utils::DesignError);
	BOOST_CHECK_THROW(config["driver/max_wait_edges"].as<size_t>(1000), cdcb::utils::DesignError);
	BOOST_TEST(config["driver/max_wait_edges"].as<int>() == -1);
	BOOST_CHECK_THROW(config["device/depth"].as<size_t>(), cdcb::utils::DesignError);
	BOOST_TEST(config["waveform/enabled"].as<bool>());
}

BOOST_AUTO_TEST_CASE(ConfigTree_Errors)
{
	cdcb::utils::ConfigTree config;
	BOOST_CHECK_THROW(config.loadFromString("a: [1, 2"), cdcb::utils::DesignError);
	BOOST_CHECK_THROW(config.loadFromFile("/nonexistent/cdcbench/config.yaml"), cdcb::utils::DesignError);

	config.loadFromString("depth: eight");
	BOOST_CHECK_THROW(config["depth"].as<size_t>(), cdcb::utils::DesignError);
}
