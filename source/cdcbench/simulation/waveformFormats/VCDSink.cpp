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
#include "cdcbench/pch.h"
#include "VCDSink.h"

#include "../Simulator.h"
#include "../Pin.h"

namespace cdcb::sim {

VCDSink::VCDSink(Simulator &simulator, std::vector<const PinBase*> pins, std::string filename) :
	m_simulator(simulator), m_writer(std::move(filename)), m_pins(std::move(pins))
{
	CDCB_DESIGNCHECK_HINT(!m_simulator.powerOnCalled(), "Waveform recording must be set up before power on");
	m_simulator.addCallbacks(this);
}

VCDSink::~VCDSink()
{
	m_simulator.removeCallbacks(this);
	m_writer.flush();
}

std::string VCDSink::makeCode(size_t index)
{
	// Identifier codes use the printable range from '!' to '~'.
	std::string code;
	do {
		code += (char)('!' + index % 94);
		index /= 94;
	} while (index != 0);
	return code;
}

void VCDSink::declare()
{
	size_t codeIdx = 0;
	auto module = m_writer.beginModule("fifo_bench");

	for (const auto &clock : m_simulator.getClocks()) {
		m_clockTraces.push_back({ .code = makeCode(codeIdx++) });
		m_writer.declareWire(32, m_clockTraces.back().code, clock->name() + "_edge");
	}

	for (const PinBase *pin : m_pins) {
		m_pinTraces.push_back({ .code = makeCode(codeIdx++) });
		m_writer.declareWire(pin->width(), m_pinTraces.back().code, pin->name());
	}
}

void VCDSink::onPowerOn()
{
	declare();
}

void VCDSink::onNewTick(const SimTime &simulationTime)
{
	m_writer.writeTime(toPicoseconds(simulationTime));
}

void VCDSink::onCommitState()
{
	if (!m_dumpedInitialValues) {
		auto dumpVars = m_writer.beginDumpVars();
		writeChanges(true);
		m_dumpedInitialValues = true;
	} else
		writeChanges(false);
}

void VCDSink::writeChanges(bool force)
{
	const auto &clocks = m_simulator.getClocks();
	for (size_t i = 0; i < m_clockTraces.size(); i++) {
		auto &trace = m_clockTraces[i];
		std::uint64_t edges = clocks[i]->edgeCount();
		if (force || trace.value != edges) {
			trace.value = edges;
			trace.defined = true;
			m_writer.writeState(trace.code, 32, true, edges & 0xFFFFFFFF);
		}
	}

	for (size_t i = 0; i < m_pins.size(); i++) {
		auto &trace = m_pinTraces[i];
		const PinBase &pin = *m_pins[i];
		if (force || trace.defined != pin.defined() || trace.value != pin.rawValue()) {
			trace.value = pin.rawValue();
			trace.defined = pin.defined();
			if (pin.width() == 1)
				m_writer.writeBitState(trace.code, trace.defined, trace.value != 0);
			else
				m_writer.writeState(trace.code, pin.width(), trace.defined, trace.value);
		}
	}
}

}
