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
#include "Sequencer.h"

namespace cdcb::tb {

void Sequencer::push(Transaction transaction)
{
	CDCB_DESIGNCHECK_HINT(!m_closed, "Can not push transactions into a closed sequencer");
	m_queue.push_back({ m_nextId++, std::move(transaction) });
	m_itemAvailable.notify_all();
}

void Sequencer::push(std::span<const Transaction> transactions)
{
	for (const auto &transaction : transactions)
		push(transaction);
}

void Sequencer::close()
{
	m_closed = true;
	m_itemAvailable.notify_all();
}

SimProcess Sequencer::execute(Transaction transaction)
{
	size_t id = m_nextId;
	push(std::move(transaction));

	// Items complete in order, so the item is done once more than id items completed.
	while (m_numCompleted <= id)
		co_await m_itemCompleted.wait();
}

SimFunction<std::optional<Transaction>> Sequencer::next()
{
	CDCB_DESIGNCHECK_HINT(!m_inFlight, "The previous transaction must be completed before requesting the next one");

	while (m_queue.empty() && !m_closed)
		co_await m_itemAvailable.wait();

	if (m_queue.empty())
		co_return std::nullopt;

	m_inFlight = std::move(m_queue.front());
	m_queue.pop_front();
	co_return m_inFlight->transaction;
}

void Sequencer::complete(const Transaction &transaction)
{
	CDCB_DESIGNCHECK_HINT(m_inFlight, "complete() called without a transaction in flight");
	CDCB_DESIGNCHECK_HINT(m_inFlight->transaction == transaction, "complete() must be called with the transaction obtained from next()");

	m_inFlight.reset();
	m_numCompleted++;
	m_itemCompleted.notify_all();
}

SimProcess Sequencer::idle()
{
	while (!m_queue.empty() || m_inFlight)
		co_await m_itemCompleted.wait();
}

}
