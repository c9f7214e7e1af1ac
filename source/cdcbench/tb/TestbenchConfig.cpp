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
#include "TestbenchConfig.h"

#include "../utils/ConfigTree.h"

namespace cdcb::tb {

namespace {
	void loadClock(const utils::ConfigTree &config, sim::ClockConfig &clock)
	{
		if (!config)
			return;

		clock.name = config["name"].as<std::string>(clock.name);
		if (auto period = config["period_ns"]) {
			std::uint64_t ns = period.as<std::uint64_t>();
			CDCB_DESIGNCHECK_HINT(ns > 0, "Clock " + clock.name + " needs a period of at least 1ns");
			clock.period = sim::nanoseconds(ns);
		}
		if (auto phase = config["phase_ns"])
			clock.phase = sim::nanoseconds(phase.as<std::uint64_t>());
	}

	std::optional<dbg::LogMessage::Severity> parseLogLevel(const std::string &level)
	{
		if (level == "info") return dbg::LogMessage::LOG_INFO;
		if (level == "warning") return dbg::LogMessage::LOG_WARNING;
		if (level == "error") return dbg::LogMessage::LOG_ERROR;
		if (level == "none") return std::nullopt;
		throw utils::DesignError(__FILE__, __LINE__, "Unknown log level '" + level + "'. Valid values are info, warning, error or none");
	}
}

void TestbenchConfig::load(const utils::ConfigTree &config)
{
	loadClock(config["clocks/write"], writeClock);
	loadClock(config["clocks/read"], readClock);
	CDCB_DESIGNCHECK_HINT(writeClock.name != readClock.name, "Both clocks need distinct names");

	reset.holdEdges = config["reset/hold_edges"].as<size_t>(reset.holdEdges);
	reset.settleEdges = config["reset/settle_edges"].as<size_t>(reset.settleEdges);
	CDCB_DESIGNCHECK_HINT(reset.holdEdges > 0, "reset/hold_edges must be at least 1");

	maxWaitEdges = config["driver/max_wait_edges"].as<size_t>(maxWaitEdges);

	device.depth = config["device/depth"].as<size_t>(device.depth);
	device.syncStages = config["device/sync_stages"].as<size_t>(device.syncStages);

	if (auto level = config["log/level"])
		logLevel = parseLogLevel(level.as<std::string>());

	if (auto vcd = config["waveform/vcd"])
		vcdFile = vcd.as<std::string>();

	if (auto transactions = config["sequence"]) {
		CDCB_DESIGNCHECK_HINT(transactions.isSequence(), "sequence must be a list of transactions");
		sequence.clear();
		for (auto entry : transactions)
			sequence.push_back(Transaction::parse(entry.as<std::string>()));
	}
}

}
