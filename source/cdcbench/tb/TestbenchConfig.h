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

#include "ResetCoordinator.h"
#include "Transaction.h"

#include "../debug/DebugInterface.h"
#include "../device/AsyncFifoModel.h"
#include "../simulation/Clock.h"

#include <optional>
#include <string>
#include <vector>

namespace cdcb::utils {
	class ConfigTree;
}

namespace cdcb::tb {

/**
 * @brief Everything needed to set up a testbench run, loadable from yaml.
 */
struct TestbenchConfig
{
	sim::ClockConfig writeClock{ .name = "clk_wr", .period = sim::nanoseconds(10) };
	sim::ClockConfig readClock{ .name = "clk_rd", .period = sim::nanoseconds(14) };
	ResetConfig reset;
	/// Upper bound on the edges the driver waits for full/empty to clear.
	size_t maxWaitEdges = 1000;
	dev::AsyncFifoParams device;

	/// Messages below this severity are dropped, std::nullopt disables logging.
	std::optional<dbg::LogMessage::Severity> logLevel = dbg::LogMessage::LOG_WARNING;
	std::optional<std::string> vcdFile;

	/// Transactions to run, empty if the scenario provides its own.
	std::vector<Transaction> sequence;

	/// Overrides all members that are present in the config tree.
	void load(const utils::ConfigTree &config);
};

}
