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

#include <vector>

using namespace boost::unit_test;
using namespace cdcb;
using namespace cdcb::sim;
using namespace cdcb::tb;

namespace {

/// Behaves like the regular model, but returns 0x23 whenever 0x22 is read.
class CorruptingFifo : public dev::AsyncFifoModel
{
	public:
		using AsyncFifoModel::AsyncFifoModel;

		virtual void onClockEdge(const ClockDomain &clock) override {
			AsyncFifoModel::onClockEdge(clock);
			auto &dataOut = m_interface.read.dataOut;
			if (&clock == &m_interface.readClock() && dataOut.defined() && dataOut.value() == 0x22)
				dataOut.set(0x23);
		}
};

/// Never signals empty after reset and makes up read data.
class PhantomReadDevice : public ClockedComponent
{
	public:
		PhantomReadDevice(dev::FifoInterface &fifo) : m_fifo(fifo) { }

		virtual void onClockEdge(const ClockDomain &clock) override {
			if (&clock == &m_fifo.writeClock())
				m_fifo.write.full.set(false);
			if (&clock == &m_fifo.readClock()) {
				bool inReset = !m_fifo.read.rst.defined() || m_fifo.read.rst.value();
				m_fifo.read.empty.set(inReset);
				if (sim::asserted(m_fifo.read.rd))
					m_fifo.read.dataOut.set(0x5A);
			}
		}
	protected:
		dev::FifoInterface &m_fifo;
};

}

BOOST_FIXTURE_TEST_CASE(Fifo_WriteThenRead, FifoTestFixture)
{
	setup();
	std::vector<std::uint8_t> values = { 0x11, 0x22, 0x33, 0x44 };

	runScenario([&]()->SimProcess {
		co_await bench().bringUp();
		for (auto v : values)
			co_await bench().writePort().write(v);
		for (size_t i = 0; i < values.size(); i++)
			co_await bench().readPort().read();
		co_await bench().settle();
	});

	auto report = bench().scoreboard().report();
	BOOST_TEST(report.passed());
	BOOST_TEST(report.acceptedWrites == 4u);
	BOOST_TEST(report.acceptedReads == 4u);
	BOOST_TEST(report.resets == 1u);
	BOOST_TEST(report.pending == 0u);
	BOOST_TEST(bench().scoreboard().readHistory() == values, boost::test_tools::per_element());
	BOOST_TEST(sim::asserted(fifo().read.empty));
}

BOOST_FIXTURE_TEST_CASE(Fifo_SequencerDrivenRun, FifoTestFixture)
{
	setup();
	std::vector<std::uint8_t> values = { 0xDE, 0xAD, 0xBE, 0xEF, 0x00, 0xFF };

	runScenario([&]()->SimProcess {
		co_await bench().run(sequences::writeThenRead(values));
	});

	BOOST_TEST(bench().scoreboard().passed());
	BOOST_TEST(bench().driver().numWrites() == 6u);
	BOOST_TEST(bench().driver().numReads() == 6u);
	BOOST_TEST(bench().sequencer().numCompleted() == 12u);
	BOOST_TEST(bench().scoreboard().readHistory() == values, boost::test_tools::per_element());
}

BOOST_FIXTURE_TEST_CASE(Fifo_RunsSequenceFromConfig, FifoTestFixture)
{
	cdcb::utils::ConfigTree tree;
	tree.loadFromString(R"(
clocks:
  write: { period_ns: 7 }
  read: { period_ns: 13, phase_ns: 3 }
reset: { hold_edges: 2, settle_edges: 3 }
sequence: [ "write 0x01", "write 0x02", "read", "write 0x03", "read", "read" ]
)");
	TestbenchConfig config;
	config.load(tree);
	setup(config);

	runScenario([&]()->SimProcess {
		co_await bench().run(this->config().sequence);
	});

	BOOST_TEST(bench().scoreboard().passed());
	std::vector<std::uint8_t> expected = { 0x01, 0x02, 0x03 };
	BOOST_TEST(bench().scoreboard().readHistory() == expected, boost::test_tools::per_element());
}

BOOST_FIXTURE_TEST_CASE(Fifo_FullBackpressure, FifoTestFixture)
{
	setup();

	runScenario([&]()->SimProcess {
		co_await bench().bringUp();
		for (std::uint8_t i = 1; i <= 20; i++)
			co_await bench().writePort().attemptWrite(i);
		co_await bench().settle();
		BOOST_TEST(sim::asserted(fifo().write.full));
	});

	auto report = bench().scoreboard().report();
	BOOST_TEST(report.acceptedWrites == 8u);
	BOOST_TEST(report.pending == 8u);
	BOOST_TEST(model().fillLevelWriteSide() == 8u);

	std::vector<std::uint8_t> expected = { 1, 2, 3, 4, 5, 6, 7, 8 };
	std::vector<std::uint8_t> reference(bench().scoreboard().referenceQueue().begin(), bench().scoreboard().referenceQueue().end());
	BOOST_TEST(reference == expected, boost::test_tools::per_element());
}

BOOST_FIXTURE_TEST_CASE(Fifo_FullClearsAfterRead, FifoTestFixture)
{
	setup();

	runScenario([&]()->SimProcess {
		co_await bench().bringUp();
		for (std::uint8_t i = 0; i < 8; i++)
			co_await bench().writePort().write(i);

		bench().writePort().maxWaitEdges(4);
		bool written = co_await bench().writePort().tryWrite(0x80);
		BOOST_TEST(!written);

		co_await bench().readPort().read();

		// The read pointer needs to cross into the write domain before full clears.
		bench().writePort().maxWaitEdges(20);
		written = co_await bench().writePort().tryWrite(0x80);
		BOOST_TEST(written);

		for (size_t i = 0; i < 8; i++)
			co_await bench().readPort().read();
		co_await bench().settle();
	});

	BOOST_TEST(bench().scoreboard().passed());
	std::vector<std::uint8_t> expected = { 0, 1, 2, 3, 4, 5, 6, 7, 0x80 };
	BOOST_TEST(bench().scoreboard().readHistory() == expected, boost::test_tools::per_element());
}

BOOST_FIXTURE_TEST_CASE(Fifo_EmptyFlag, FifoTestFixture)
{
	setup();

	size_t edgesUntilNotEmpty = 0;
	runScenario([&]()->SimProcess {
		co_await bench().bringUp();
		BOOST_TEST(fifo().read.empty.defined());
		BOOST_TEST(sim::asserted(fifo().read.empty));

		co_await bench().writePort().write(0x5A);
		while (sim::asserted(fifo().read.empty)) {
			co_await OnClk(readClock());
			edgesUntilNotEmpty++;
		}

		co_await bench().readPort().read();
		co_await bench().settle();
		BOOST_TEST(sim::asserted(fifo().read.empty));
	});

	// Two synchronizer stages plus the registered flag.
	BOOST_TEST(edgesUntilNotEmpty >= 2u);
	BOOST_TEST(edgesUntilNotEmpty <= 3u);
	BOOST_TEST(bench().scoreboard().readHistory() == std::vector<std::uint8_t>({ 0x5A }), boost::test_tools::per_element());
}

BOOST_FIXTURE_TEST_CASE(Fifo_FastWriterSlowReader, FifoTestFixture)
{
	TestbenchConfig config;
	config.writeClock.period = nanoseconds(8);
	config.readClock.period = nanoseconds(20);
	setup(config);

	auto transactions = sequences::randomChunks(32, 8, 7);
	runScenario([&]()->SimProcess {
		co_await bench().run(transactions);
	});

	BOOST_TEST(bench().scoreboard().passed());
	BOOST_TEST(bench().scoreboard().report().acceptedReads == 32u);
	BOOST_TEST(bench().scoreboard().readHistory() == sequences::payloads(transactions), boost::test_tools::per_element());
}

BOOST_FIXTURE_TEST_CASE(Fifo_SlowWriterFastReader, FifoTestFixture)
{
	TestbenchConfig config;
	config.writeClock.period = nanoseconds(20);
	config.readClock.period = nanoseconds(8);
	config.readClock.phase = nanoseconds(3);
	setup(config);

	auto transactions = sequences::randomChunks(32, 8, 8);
	runScenario([&]()->SimProcess {
		co_await bench().run(transactions);
	});

	BOOST_TEST(bench().scoreboard().passed());
	BOOST_TEST(bench().scoreboard().readHistory() == sequences::payloads(transactions), boost::test_tools::per_element());
}

BOOST_FIXTURE_TEST_CASE(Fifo_RandomChunks, FifoTestFixture)
{
	setup();

	auto transactions = sequences::randomChunks(16, 4, 42);
	runScenario([&]()->SimProcess {
		co_await bench().run(transactions);
	});

	auto report = bench().scoreboard().report();
	BOOST_TEST(report.passed());
	BOOST_TEST(report.acceptedWrites == 16u);
	BOOST_TEST(report.acceptedReads == 16u);
	BOOST_TEST(bench().scoreboard().readHistory() == sequences::payloads(transactions), boost::test_tools::per_element());
}

BOOST_FIXTURE_TEST_CASE(Fifo_ConcurrentWriterAndReader, FifoTestFixture)
{
	setup();

	std::vector<std::uint8_t> values;
	for (size_t i = 0; i < 40; i++)
		values.push_back((std::uint8_t)(i * 7 + 3));

	runScenario([&]()->SimProcess {
		co_await bench().bringUp();

		auto writer = sim::fork([&]()->SimProcess {
			for (auto v : values)
				co_await bench().writePort().write(v);
		});
		auto reader = sim::fork([&]()->SimProcess {
			for (size_t i = 0; i < values.size(); i++)
				co_await bench().readPort().read();
		});

		co_await join(writer);
		co_await join(reader);
		co_await bench().settle();
	});

	BOOST_TEST(bench().scoreboard().passed());
	BOOST_TEST(bench().scoreboard().pending() == 0u);
	BOOST_TEST(bench().scoreboard().readHistory() == values, boost::test_tools::per_element());
}

BOOST_FIXTURE_TEST_CASE(Fifo_ResetDiscardsContents, FifoTestFixture)
{
	setup();

	bool readAfterReset = true;
	runScenario([&]()->SimProcess {
		co_await bench().bringUp();
		co_await bench().writePort().write(0xAA);
		co_await bench().settle(4);
		BOOST_TEST(bench().scoreboard().pending() == 1u);

		co_await bench().resetCoordinator().reset();

		bench().readPort().maxWaitEdges(20);
		readAfterReset = co_await bench().readPort().tryRead();
		co_await bench().settle();
	});

	BOOST_TEST(!readAfterReset);
	BOOST_TEST(bench().resetCoordinator().numResets() == 2u);
	auto report = bench().scoreboard().report();
	BOOST_TEST(report.resets == 2u);
	BOOST_TEST(report.pending == 0u);
	BOOST_TEST(report.acceptedReads == 0u);
	BOOST_TEST(report.passed());
}

BOOST_FIXTURE_TEST_CASE(Fifo_ResetDuringOperation, FifoTestFixture)
{
	setup();

	runScenario([&]()->SimProcess {
		co_await bench().bringUp();
		for (std::uint8_t v : { 0x01, 0x02, 0x03 })
			co_await bench().writePort().write(v);
		co_await bench().readPort().read();
		// Let the monitors report the read before the reset discards it.
		co_await bench().settle();
		BOOST_TEST(bench().scoreboard().pending() == 2u);

		co_await bench().resetCoordinator().reset();
		BOOST_TEST(bench().scoreboard().pending() == 0u);

		co_await bench().writePort().write(0xCC);
		co_await bench().readPort().read();
		co_await bench().settle();
	});

	auto report = bench().scoreboard().report();
	BOOST_TEST(report.passed());
	BOOST_TEST(report.resets == 2u);
	BOOST_TEST(report.acceptedWrites == 4u);
	BOOST_TEST(report.pending == 0u);
	BOOST_TEST(bench().scoreboard().readHistory() == std::vector<std::uint8_t>({ 0x01, 0xCC }), boost::test_tools::per_element());
}

BOOST_FIXTURE_TEST_CASE(Fifo_ResetCoordinatorStates, FifoTestFixture)
{
	setup();
	auto &coordinator = bench().resetCoordinator();
	BOOST_TEST(coordinator.state() == ResetCoordinator::RESETTING);

	size_t operationalAtReadEdge = 0;
	runScenario([&]()->SimProcess {
		auto waiter = sim::fork([&]()->SimProcess {
			co_await coordinator.waitOperational();
			operationalAtReadEdge = readClock().edgeCount();
		});

		co_await coordinator.reset(2, 3);
		BOOST_TEST(coordinator.operational());
		BOOST_TEST(readClock().edgeCount() == 5u);
		BOOST_TEST(writeClock().edgeCount() >= 5u);
		BOOST_TEST(fifo().write.rst.defined());
		BOOST_TEST(!fifo().write.rst.value());
		BOOST_TEST(!sim::asserted(fifo().read.rst));
		BOOST_TEST(sim::asserted(fifo().read.empty));
		BOOST_TEST(!sim::asserted(fifo().write.full));

		co_await join(waiter);

		// Already operational, returns without waiting.
		co_await coordinator.waitOperational();
		BOOST_TEST(readClock().edgeCount() == 5u);

		BOOST_CHECK_THROW(co_await coordinator.reset(0, 1), cdcb::utils::DesignError);
	});

	BOOST_TEST(operationalAtReadEdge == 5u);
	BOOST_TEST(coordinator.numResets() == 1u);
}

BOOST_FIXTURE_TEST_CASE(Fifo_UndefinedFlagsBeforeReset, FifoTestFixture)
{
	setup();

	runScenario([&]()->SimProcess {
		bench().writePort().maxWaitEdges(5);
		bench().readPort().maxWaitEdges(5);

		bool written = co_await bench().writePort().tryWrite(1);
		BOOST_TEST(!written);
		BOOST_TEST(!fifo().write.full.defined());

		bool read = co_await bench().readPort().tryRead();
		BOOST_TEST(!read);
		BOOST_TEST(!fifo().read.empty.defined());
	});
}

BOOST_FIXTURE_TEST_CASE(Fifo_WriteTimeoutIsLivenessFailure, FifoTestFixture)
{
	setup();

	auto scenario = [&]()->SimProcess {
		co_await bench().bringUp();
		for (std::uint8_t i = 0; i < 8; i++)
			co_await bench().writePort().write(i);

		bench().writePort().maxWaitEdges(16);
		co_await bench().writePort().write(0x99);
	};

	BOOST_CHECK_THROW(runScenario(scenario), LivenessTimeout);
}

BOOST_FIXTURE_TEST_CASE(Fifo_ReadTimeoutIsLivenessFailure, FifoTestFixture)
{
	setup();

	auto scenario = [&]()->SimProcess {
		co_await bench().bringUp();
		bench().readPort().maxWaitEdges(10);
		co_await bench().readPort().read();
	};

	BOOST_CHECK_THROW(runScenario(scenario), LivenessTimeout);
}

BOOST_FIXTURE_TEST_CASE(Fifo_CorruptedDataIsReported, FifoTestFixture)
{
	setupInterface();
	CorruptingFifo device(fifo(), config().device);
	attachDevice(device);

	std::vector<std::uint8_t> values = { 0x11, 0x22, 0x33 };
	runScenario([&]()->SimProcess {
		co_await bench().run(sequences::writeThenRead(values));
	});

	auto report = bench().scoreboard().report();
	BOOST_TEST(!report.passed());
	BOOST_TEST(!report.protocolViolation);
	BOOST_TEST(report.acceptedReads == 3u);
	BOOST_TEST(report.pending == 0u);
	BOOST_REQUIRE(report.mismatches.size() == 1);
	BOOST_TEST((report.mismatches.front() == Mismatch{ 1, 0x22, 0x23 }));
}

BOOST_FIXTURE_TEST_CASE(Fifo_ReadWithoutWriteIsProtocolViolation, FifoTestFixture)
{
	setupInterface();
	PhantomReadDevice device(fifo());
	attachDevice(device);

	auto scenario = [&]()->SimProcess {
		co_await bench().bringUp();
		co_await bench().readPort().read();
		co_await bench().settle();
	};

	BOOST_CHECK_THROW(runScenario(scenario), ProtocolViolation);
	BOOST_TEST(bench().scoreboard().report().protocolViolation);
	BOOST_TEST(bench().scoreboard().readHistory() == std::vector<std::uint8_t>({ 0x5A }), boost::test_tools::per_element());
}
