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
#include "FifoMonitor.h"

#include "../debug/DebugInterface.h"
#include "../simulation/Simulator.h"
#include "../simulation/simProc/WaitClock.h"
#include "../simulation/simProc/WaitStable.h"

namespace cdcb::tb {

using sim::OnClk;
using sim::WaitStable;
using dbg::LogMessage;

std::string Event::toString() const
{
	switch (kind) {
		case WRITE: return "write " + dbg::hexByte(data);
		case READ: return "read " + dbg::hexByte(data);
		case RESET: return "reset";
	}
	return "?";
}


WriteMonitor::WriteMonitor(const dev::FifoInterface &fifo, EventChannel &events) : m_fifo(fifo), m_events(events)
{
}

SimProcess WriteMonitor::run()
{
	const auto &pins = m_fifo.write;
	m_stopRequested = false;
	m_inReset = false;

	while (!m_stopRequested) {
		co_await OnClk(m_fifo.writeClock());
		co_await WaitStable();

		bool inReset = !pins.rst.defined() || pins.rst.value();
		if (inReset) {
			if (!m_inReset) {
				m_events.push({ Event::RESET, 0 });
				dbg::log(LogMessage(&m_fifo.writeClock()) << LogMessage::LOG_INFO << LogMessage::LOG_MONITOR << "Observed reset");
			}
			m_inReset = true;
			continue;
		}
		m_inReset = false;

		if (sim::asserted(pins.wr) && pins.full.defined() && !pins.full.value()) {
			m_numWrites++;
			m_events.push({ Event::WRITE, pins.dataIn.value() });
			dbg::log(LogMessage(&m_fifo.writeClock()) << LogMessage::LOG_INFO << LogMessage::LOG_MONITOR << "Observed write of " << dbg::hexByte(pins.dataIn.value()));
		}
	}
}


ReadMonitor::ReadMonitor(const dev::FifoInterface &fifo, EventChannel &events) : m_fifo(fifo), m_events(events)
{
}

SimProcess ReadMonitor::run()
{
	const auto &pins = m_fifo.read;
	m_stopRequested = false;
	m_prevRead = false;
	m_prevEmpty = true;

	while (!m_stopRequested) {
		co_await OnClk(m_fifo.readClock());
		co_await WaitStable();

		if (sim::asserted(pins.rst) || !pins.rst.defined()) {
			if (m_prevRead && !m_prevEmpty) {
				m_numDroppedReads++;
				dbg::log(LogMessage(&m_fifo.readClock()) << LogMessage::LOG_WARNING << LogMessage::LOG_MONITOR << "Dropped read completion, rst_rd was raised after the request was accepted");
			}
			m_prevRead = false;
			m_prevEmpty = true;
			continue;
		}

		if (m_prevRead && !m_prevEmpty) {
			if (!pins.dataOut.defined())
				sim::Simulator::current()->onWarning("data_out is undefined one edge after an accepted read request at edge " + std::to_string(m_fifo.readClock().edgeCount()) + " of " + m_fifo.readClock().name());

			m_numReads++;
			m_events.push({ Event::READ, pins.dataOut.value() });
			dbg::log(LogMessage(&m_fifo.readClock()) << LogMessage::LOG_INFO << LogMessage::LOG_MONITOR << "Observed read of " << dbg::hexByte(pins.dataOut.value()));
		}

		m_prevRead = sim::asserted(pins.rd);
		// An undefined empty flag never qualifies a request.
		m_prevEmpty = !pins.empty.defined() || pins.empty.value();
	}
}


FifoMonitor::FifoMonitor(const dev::FifoInterface &fifo, EventChannel &events) :
	m_writeMonitor(fifo, events), m_readMonitor(fifo, events)
{
}

void FifoMonitor::start()
{
	sim::fork(m_writeMonitor.run());
	sim::fork(m_readMonitor.run());
}

void FifoMonitor::stop()
{
	m_writeMonitor.stop();
	m_readMonitor.stop();
}

}
