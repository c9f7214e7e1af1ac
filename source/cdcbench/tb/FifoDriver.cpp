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
#include "FifoDriver.h"
#include "VerificationErrors.h"
#include "../simulation/Clock.h"

#include "../debug/DebugInterface.h"
#include "../simulation/simProc/WaitClock.h"

namespace cdcb::tb {

using sim::OnClk;
using sim::simu;
using dbg::LogMessage;

WritePort::WritePort(dev::FifoInterface &fifo, size_t maxWaitEdges) : m_fifo(fifo), m_maxWaitEdges(maxWaitEdges)
{
}

bool WritePort::notReady() const
{
	// An undefined flag means the device has not been reset yet.
	const auto &full = m_fifo.write.full;
	return !full.defined() || full.value();
}

SimProcess WritePort::pulse(std::uint8_t payload)
{
	auto &pins = m_fifo.write;
	simu(pins.dataIn) = payload;
	simu(pins.wr) = true;
	co_await OnClk(m_fifo.writeClock());
	simu(pins.wr) = false;
}

SimFunction<bool> WritePort::tryWrite(std::uint8_t payload)
{
	co_await OnClk(m_fifo.writeClock());
	for (size_t waited = 0; notReady(); waited++) {
		if (waited == m_maxWaitEdges)
			co_return false;
		co_await OnClk(m_fifo.writeClock());
	}

	co_await pulse(payload);
	co_return true;
}

SimProcess WritePort::write(std::uint8_t payload)
{
	bool written = co_await tryWrite(payload);
	if (!written)
		throw LivenessTimeout(__FILE__, __LINE__, "full did not clear within " + std::to_string(m_maxWaitEdges) + " edges of " + m_fifo.writeClock().name() + " while writing " + dbg::hexByte(payload));
}

SimProcess WritePort::attemptWrite(std::uint8_t payload)
{
	co_await OnClk(m_fifo.writeClock());
	co_await pulse(payload);
}


ReadPort::ReadPort(dev::FifoInterface &fifo, size_t maxWaitEdges) : m_fifo(fifo), m_maxWaitEdges(maxWaitEdges)
{
}

bool ReadPort::notReady() const
{
	const auto &empty = m_fifo.read.empty;
	return !empty.defined() || empty.value();
}

SimProcess ReadPort::pulse()
{
	simu(m_fifo.read.rd) = true;
	co_await OnClk(m_fifo.readClock());
	simu(m_fifo.read.rd) = false;
}

SimFunction<bool> ReadPort::tryRead()
{
	co_await OnClk(m_fifo.readClock());
	for (size_t waited = 0; notReady(); waited++) {
		if (waited == m_maxWaitEdges)
			co_return false;
		co_await OnClk(m_fifo.readClock());
	}

	co_await pulse();
	co_return true;
}

SimProcess ReadPort::read()
{
	bool accepted = co_await tryRead();
	if (!accepted)
		throw LivenessTimeout(__FILE__, __LINE__, "empty did not clear within " + std::to_string(m_maxWaitEdges) + " edges of " + m_fifo.readClock().name());
}

SimProcess ReadPort::attemptRead()
{
	co_await OnClk(m_fifo.readClock());
	co_await pulse();
}


FifoDriver::FifoDriver(Sequencer &sequencer, WritePort &writePort, ReadPort &readPort) :
	m_sequencer(sequencer), m_writePort(writePort), m_readPort(readPort)
{
}

SimProcess FifoDriver::run()
{
	CDCB_DESIGNCHECK_HINT(!m_running, "The driver loop can only run once at a time");
	m_running = true;
	m_stopRequested = false;

	while (!m_stopRequested) {
		std::optional<Transaction> transaction = co_await m_sequencer.next();
		if (!transaction)
			break;

		dbg::log(LogMessage() << LogMessage::LOG_INFO << LogMessage::LOG_STIMULUS << "Driving " << transaction->toString());

		if (const auto *write = std::get_if<Transaction::Write>(&transaction->operation())) {
			co_await m_writePort.write(write->payload);
			m_numWrites++;
		} else {
			co_await m_readPort.read();
			m_numReads++;
		}

		m_sequencer.complete(*transaction);
	}

	m_running = false;
}

}
