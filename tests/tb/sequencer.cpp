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

BOOST_FIXTURE_TEST_CASE(Sequencer_HandsOutInOrder, UnitTestSimulationFixture)
{
	auto &clock = getSimulator().createClock({ .name = "clk" });
	Sequencer sequencer;

	std::vector<Transaction> executed;
	bool driverDone = false;
	addSimulationProcess([&]()->SimProcess {
		while (true) {
			std::optional<Transaction> transaction = co_await sequencer.next();
			if (!transaction)
				break;
			BOOST_TEST(sequencer.busy());
			executed.push_back(*transaction);
			co_await OnClk(clock);
			sequencer.complete(*transaction);
		}
		driverDone = true;
	});

	size_t executeReturnedAt = 0;
	addSimulationProcess([&]()->SimProcess {
		sequencer.push(Transaction::write(1));
		sequencer.push(Transaction::read());
		co_await sequencer.execute(Transaction::write(2));
		executeReturnedAt = clock.edgeCount();
		BOOST_TEST(sequencer.numCompleted() == 3u);
		sequencer.close();
	});

	runEdges(clock, 5);

	std::vector<Transaction> expected = { Transaction::write(1), Transaction::read(), Transaction::write(2) };
	BOOST_TEST(executed == expected, boost::test_tools::per_element());
	BOOST_TEST(executeReturnedAt == 3u);
	BOOST_TEST(driverDone);
	BOOST_TEST(!sequencer.busy());
	BOOST_TEST(sequencer.pending() == 0u);
}

BOOST_FIXTURE_TEST_CASE(Sequencer_IdleWaitsForCompletion, UnitTestSimulationFixture)
{
	auto &clock = getSimulator().createClock({ .name = "clk" });
	Sequencer sequencer;

	addSimulationProcess([&]()->SimProcess {
		while (auto transaction = co_await sequencer.next()) {
			co_await OnClk(clock);
			co_await OnClk(clock);
			sequencer.complete(*transaction);
		}
	});

	size_t idleAt = 0;
	addSimulationProcess([&]()->SimProcess {
		// Idle returns immediately if nothing was ever pushed.
		co_await sequencer.idle();
		BOOST_TEST(clock.edgeCount() == 0u);

		std::vector<Transaction> batch = sequences::reads(3);
		sequencer.push(batch);
		BOOST_TEST(sequencer.pending() == 3u);
		co_await sequencer.idle();
		idleAt = clock.edgeCount();
	});

	runEdges(clock, 8);
	BOOST_TEST(idleAt == 6u);
}

BOOST_FIXTURE_TEST_CASE(Sequencer_OneItemInFlight, UnitTestSimulationFixture)
{
	auto &clock = getSimulator().createClock({ .name = "clk" });
	Sequencer sequencer;
	sequencer.push(Transaction::write(1));
	sequencer.push(Transaction::write(2));

	bool checked = false;
	addSimulationProcess([&]()->SimProcess {
		std::optional<Transaction> first = co_await sequencer.next();
		BOOST_REQUIRE(first);
		BOOST_CHECK_THROW(co_await sequencer.next(), cdcb::utils::DesignError);
		BOOST_CHECK_THROW(sequencer.complete(Transaction::write(2)), cdcb::utils::DesignError);

		sequencer.complete(*first);
		BOOST_CHECK_THROW(sequencer.complete(*first), cdcb::utils::DesignError);

		std::optional<Transaction> second = co_await sequencer.next();
		BOOST_TEST((second == Transaction::write(2)));
		sequencer.complete(*second);
		checked = true;
	});

	runEdges(clock, 1);
	BOOST_TEST(checked);
}

BOOST_AUTO_TEST_CASE(Sequencer_ClosedRejectsPush)
{
	Sequencer sequencer;
	sequencer.close();
	BOOST_TEST(sequencer.closed());
	BOOST_CHECK_THROW(sequencer.push(Transaction::read()), cdcb::utils::DesignError);
}
