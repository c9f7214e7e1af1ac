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
#include <cdcbench/debug/DebugInterface.h>
#include <cdcbench/device/AsyncFifoModel.h>
#include <cdcbench/device/FifoInterface.h>
#include <cdcbench/simulation/Simulator.h>
#include <cdcbench/simulation/waveformFormats/VCDSink.h>
#include <cdcbench/tb/FifoTestbench.h>
#include <cdcbench/tb/Sequences.h>
#include <cdcbench/tb/TestbenchConfig.h>
#include <cdcbench/tb/VerificationErrors.h>
#include <cdcbench/utils/ConfigTree.h>

#include <array>
#include <iostream>
#include <memory>

using namespace cdcb;

int main(int argc, char *argv[])
{
	if (argc > 2) {
		std::cerr << "Usage: " << argv[0] << " [config.yaml]" << std::endl;
		return 2;
	}

	try {
		utils::ConfigTree configTree;
		if (argc == 2)
			configTree.loadFromFile(argv[1]);

		tb::TestbenchConfig config;
		config.load(configTree);

		if (config.logLevel)
			dbg::logConsole(*config.logLevel);
		else
			dbg::logNothing();

		if (config.sequence.empty()) {
			std::array<std::uint8_t, 4> values = { 0x11, 0x22, 0x33, 0x44 };
			config.sequence = tb::sequences::writeThenRead(values);
		}

		sim::Simulator simulator;
		auto &writeClock = simulator.createClock(config.writeClock);
		auto &readClock = simulator.createClock(config.readClock);

		dev::FifoInterface fifo(writeClock, readClock);
		dev::AsyncFifoModel device(fifo, config.device);
		simulator.addClockedComponent(&device);

		std::unique_ptr<sim::VCDSink> vcd;
		if (config.vcdFile)
			vcd = std::make_unique<sim::VCDSink>(simulator, fifo.allPins(), *config.vcdFile);

		tb::FifoTestbench bench(fifo, config);
		simulator.executeCoroutine(bench.run(config.sequence));

		tb::ScoreboardReport report = bench.scoreboard().report();
		std::cout << report;
		return report.passed() ? 0 : 1;

	} catch (const tb::VerificationError &e) {
		std::cerr << "Verification failed: " << e.what() << std::endl;
		for (const auto &frame : e.getStackTrace().formatEntriesFiltered())
			std::cerr << "\t" << frame << std::endl;
		return 1;
	} catch (const utils::DesignError &e) {
		std::cerr << e << std::endl;
		return 2;
	} catch (const utils::InternalError &e) {
		std::cerr << e << std::endl;
		return 3;
	}
}
