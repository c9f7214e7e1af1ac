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

#include "Transaction.h"

#include "../simulation/simProc/Condition.h"
#include "../simulation/simProc/SimulationProcess.h"

#include <deque>
#include <optional>
#include <span>

namespace cdcb::tb {

/**
 * @brief Hands transactions to a driver strictly one at a time and in the order they were enqueued.
 * @details The driver fetches an item with next() and must report it with complete() before fetching the next one.
 * Producers either enqueue with push() or use execute() to wait until the driver has finished their item.
 */
class Sequencer
{
	public:
		void push(Transaction transaction);
		void push(std::span<const Transaction> transactions);

		/// No more transactions will be pushed. next() returns std::nullopt once the queue is drained.
		void close();
		bool closed() const { return m_closed; }

		/// Enqueues a transaction and suspends until the driver completed it.
		SimProcess execute(Transaction transaction);

		/// Suspends until a transaction is available and hands it out. Returns std::nullopt once closed and drained.
		SimFunction<std::optional<Transaction>> next();
		/// Marks the transaction obtained from next() as done.
		void complete(const Transaction &transaction);

		/// Suspends until all enqueued transactions have been completed.
		SimProcess idle();

		size_t pending() const { return m_queue.size(); }
		bool busy() const { return m_inFlight.has_value(); }
		size_t numCompleted() const { return m_numCompleted; }
	protected:
		struct Item {
			size_t id;
			Transaction transaction;
		};

		std::deque<Item> m_queue;
		std::optional<Item> m_inFlight;
		size_t m_nextId = 0;
		size_t m_numCompleted = 0;
		bool m_closed = false;

		sim::Condition m_itemAvailable;
		sim::Condition m_itemCompleted;
};

}
