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
#pragma once

#include "../utils/Exceptions.h"

#include <concepts>
#include <cstdint>
#include <string>

namespace cdcb::sim {

/**
 * @brief A named signal at the boundary between the harness and the device.
 * @details Every pin carries a value and a defined flag. Pins start out undefined.
 */
class PinBase
{
	public:
		enum Direction {
			/// Driven by simulation processes, sampled by the device.
			INPUT,
			/// Driven by the device, sampled by simulation processes.
			OUTPUT
		};

		PinBase(std::string name, Direction direction, size_t width) : m_name(std::move(name)), m_direction(direction), m_width(width) { }
		virtual ~PinBase() = default;

		PinBase(const PinBase &) = delete;
		PinBase &operator=(const PinBase &) = delete;

		const std::string &name() const { return m_name; }
		Direction direction() const { return m_direction; }
		size_t width() const { return m_width; }

		bool defined() const { return m_defined; }
		virtual std::uint64_t rawValue() const = 0;
	protected:
		std::string m_name;
		Direction m_direction;
		size_t m_width;
		bool m_defined = false;
};

template<typename T>
concept PinValue = std::same_as<T, bool> || std::same_as<T, std::uint8_t>;

template<PinValue T>
class Pin : public PinBase
{
	public:
		Pin(std::string name, Direction direction) : PinBase(std::move(name), direction, std::same_as<T, bool> ? 1 : 8) { }

		/// Returns the current value. Only meaningful if defined().
		T value() const { return m_value; }

		void set(T value) { m_value = value; m_defined = true; }
		void invalidate() { m_defined = false; }

		virtual std::uint64_t rawValue() const override { return m_value; }
	protected:
		T m_value = T{};
};

/**
 * @brief Access to a pin from within simulation processes, see simu().
 * @details Assigning drives the pin and is only allowed for input pins and outside of the read-only phase.
 */
template<PinValue T>
class SigHandle
{
	public:
		explicit SigHandle(Pin<T> &pin) : m_pin(pin) { }

		SigHandle &operator=(T value);
		void invalidate();

		operator T() const { return m_pin.value(); }
		T value() const { return m_pin.value(); }
		bool defined() const { return m_pin.defined(); }
	protected:
		Pin<T> &m_pin;
};

/// Notifies the active simulator that a process drives a pin. Throws if the pin may not be driven right now.
void pinDrivenByProcess(const PinBase &pin);

template<PinValue T>
SigHandle<T> &SigHandle<T>::operator=(T value)
{
	pinDrivenByProcess(m_pin);
	m_pin.set(value);
	return *this;
}

template<PinValue T>
void SigHandle<T>::invalidate()
{
	pinDrivenByProcess(m_pin);
	m_pin.invalidate();
}

template<PinValue T>
SigHandle<T> simu(Pin<T> &pin) { return SigHandle<T>(pin); }

/// True if the pin is defined and asserted.
inline bool asserted(const Pin<bool> &pin) { return pin.defined() && pin.value(); }

}
