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

#include "Condition.h"
#include "SimulationProcess.h"

#include <deque>
#include <optional>

namespace cdcb::sim {

/**
 * @brief Unbounded, ordered queue between simulation processes.
 * @details push() never blocks. pop() suspends the calling process until an item is available.
 * Items are handed out strictly in the order they were pushed.
 */
template<typename T>
class Channel
{
	public:
		void push(T item) {
			m_items.push_back(std::move(item));
			m_itemAvailable.notify_oldest();
		}

		SimFunction<T> pop() {
			while (m_items.empty())
				co_await m_itemAvailable.wait();

			T item = std::move(m_items.front());
			m_items.pop_front();
			co_return item;
		}

		std::optional<T> tryPop() {
			if (m_items.empty())
				return std::nullopt;
			T item = std::move(m_items.front());
			m_items.pop_front();
			return item;
		}

		bool empty() const { return m_items.empty(); }
		size_t size() const { return m_items.size(); }
	protected:
		std::deque<T> m_items;
		Condition m_itemAvailable;
};

}
