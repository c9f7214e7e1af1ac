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

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace boost::unit_test;
using namespace cdcb;
using namespace cdcb::sim;

namespace {

class Counter : public ClockedComponent
{
	public:
		Counter(const ClockDomain &clock) : m_clock(clock) { }

		virtual void onPowerOn() override { count.set(0); }
		virtual void onClockEdge(const ClockDomain &clock) override {
			if (&clock == &m_clock && sim::asserted(enable))
				count.set(count.value() + 1);
		}

		Pin<bool> enable{ "enable", PinBase::INPUT };
		Pin<std::uint8_t> count{ "count", PinBase::OUTPUT };
	protected:
		const ClockDomain &m_clock;
};

std::string readFile(const std::filesystem::path &path)
{
	std::ifstream file(path);
	std::stringstream content;
	content << file.rdbuf();
	return content.str();
}

}

BOOST_FIXTURE_TEST_CASE(VCD_RecordsPinsAndEdges, UnitTestSimulationFixture)
{
	auto &clock = getSimulator().createClock({ .name = "clk", .period = nanoseconds(10) });
	Counter counter(clock);
	getSimulator().addClockedComponent(&counter);

	auto path = std::filesystem::temp_directory_path() / "cdcbench_vcd_test" / "counter.vcd";
	auto sink = std::make_unique<VCDSink>(getSimulator(), std::vector<const PinBase*>{ &counter.enable, &counter.count }, path.string());

	addSimulationProcess([&]()->SimProcess {
		co_await OnClk(clock);
		simu(counter.enable) = true;
		co_await OnClk(clock);
		co_await OnClk(clock);
		simu(counter.enable) = false;
	});

	runEdges(clock, 4);
	BOOST_TEST(counter.count.value() == 2);

	sink.reset();
	std::string vcd = readFile(path);

	BOOST_TEST(vcd.find("$timescale\n1ps\n$end") != std::string::npos);
	BOOST_TEST(vcd.find("$scope module fifo_bench $end") != std::string::npos);
	BOOST_TEST(vcd.find(" clk_edge $end") != std::string::npos);
	BOOST_TEST(vcd.find("$var wire 1 \" enable $end") != std::string::npos);
	BOOST_TEST(vcd.find("$var wire 8 # count $end") != std::string::npos);
	BOOST_TEST(vcd.find("$enddefinitions $end") < vcd.find("$dumpvars"));
	// enable is undefined until the process drives it after the first edge.
	BOOST_TEST(vcd.find("X\"") != std::string::npos);
	BOOST_TEST(vcd.find("#10000\n") != std::string::npos);
	BOOST_TEST(vcd.find("#40000\n") != std::string::npos);
	BOOST_TEST(vcd.find("b00000010 #") != std::string::npos);

	std::filesystem::remove_all(path.parent_path());
}

BOOST_FIXTURE_TEST_CASE(VCD_RequiresSetupBeforePowerOn, UnitTestSimulationFixture)
{
	auto &clock = getSimulator().createClock({ .name = "clk" });
	runEdges(clock, 1);

	auto path = std::filesystem::temp_directory_path() / "cdcbench_vcd_late.vcd";
	BOOST_CHECK_THROW(std::make_unique<VCDSink>(getSimulator(), std::vector<const PinBase*>{}, path.string()), cdcb::utils::DesignError);
	std::filesystem::remove(path);
}
