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

#include "../../utils/Exceptions.h"
#include "../../utils/Preprocessor.h"

#include <concepts>
#include <coroutine>
#include <cstdlib>
#include <functional>
#include <map>
#include <memory>
#include <queue>
#include <vector>

namespace cdcb::sim {

namespace internal {

/**
 * @brief Reference counted part of every simulation coroutine promise.
 * @details Also keeps the list of coroutines that co_await the completion of this one.
 */
class PromiseBase
{
	public:
		void registerHandle() { m_numHandles++; }
		void deregisterHandle() { CDCB_ASSERT(m_numHandles > 0); m_numHandles--; }
		size_t numReferences() const { return m_numHandles; }

		std::vector<std::coroutine_handle<>> awaitingFinalSuspend;
	protected:
		size_t m_numHandles = 0;
};

/**
 * @brief Type-erased, reference counted coroutine handle that destroys the coroutine with the last reference.
 */
class CoroutineRef
{
	public:
		CoroutineRef() = default;

		template<std::derived_from<PromiseBase> PromiseType>
		CoroutineRef(std::coroutine_handle<PromiseType> handle) : m_handle(handle) {
			if (m_handle) {
				m_promise = &handle.promise();
				m_promise->registerHandle();
			}
		}

		CoroutineRef(const CoroutineRef &other) : m_handle(other.m_handle), m_promise(other.m_promise) {
			if (m_promise)
				m_promise->registerHandle();
		}

		CoroutineRef(CoroutineRef &&other) noexcept : m_handle(other.m_handle), m_promise(other.m_promise) {
			other.m_handle = {};
			other.m_promise = nullptr;
		}

		~CoroutineRef() { reset(); }

		CoroutineRef &operator=(const CoroutineRef &other) {
			if (other.m_promise == m_promise) return *this;
			CoroutineRef copy(other);
			std::swap(m_handle, copy.m_handle);
			std::swap(m_promise, copy.m_promise);
			return *this;
		}

		CoroutineRef &operator=(CoroutineRef &&other) noexcept {
			std::swap(m_handle, other.m_handle);
			std::swap(m_promise, other.m_promise);
			return *this;
		}

		void reset() {
			if (m_promise) {
				m_promise->deregisterHandle();
				if (m_promise->numReferences() == 0)
					m_handle.destroy();
				m_promise = nullptr;
				m_handle = {};
			}
		}

		explicit operator bool() const { return (bool) m_handle; }

		void resume() const {
			if (m_handle)
				m_handle.resume();
		}

		bool done() const {
			if (!m_handle)
				return true;
			return m_handle.done();
		}

		size_t numReferences() const { return m_promise ? m_promise->numReferences() : 0; }

		PromiseBase *promise() const { return m_promise; }
		std::coroutine_handle<> rawHandle() const { return m_handle; }
	protected:
		std::coroutine_handle<> m_handle = {};
		PromiseBase *m_promise = nullptr;
};

}


template<typename ReturnValue = void>
struct base_promise_type : public internal::PromiseBase {
	ReturnValue returnValue;
	template<std::convertible_to<ReturnValue> From>
	void return_value(From &&from) { returnValue = std::forward<From>(from); }
};

template<>
struct base_promise_type<void> : public internal::PromiseBase {
	void return_void() { }
};


class SimulationCoroutineHandler;

/**
 * @brief Return type of all simulation coroutines.
 * @details A SimulationFunction is lazy: the body does not run until it is either co_awaited by another simulation coroutine
 * (sub process call, the caller resumes once the callee returned) or started as an independent process through fork() or Simulator::addSimulationProcess.
 * The coroutine frame is reference counted and lives as long as any SimulationFunction or pending join refers to it.
 */
template<typename ReturnValue = void>
class SimulationFunction {
	public:
		struct promise_type : public base_promise_type<ReturnValue> {

			using returnType = ReturnValue;

			promise_type() = default;
			promise_type(const promise_type &) = delete;
			void operator=(const promise_type &) = delete;

			auto get_return_object() { return std::coroutine_handle<promise_type>::from_promise(*this); }
			auto initial_suspend() { return std::suspend_always(); }
			void unhandled_exception() { throw; }

			/**
			 * @brief Special awaiter for the final suspend that potentially resumes the calling simulation processes.
			 * @details Resume doesn't happen directly, but by adding the awaiting handles to the queue of ready coroutines of the SimulationCoroutineHandler.
			 */
			struct FinalSuspendAwaiter {
				bool await_ready() noexcept { return false; }
				void await_suspend(std::coroutine_handle<promise_type> handle) noexcept;
				void await_resume() noexcept {}
			};
			auto final_suspend() noexcept { return FinalSuspendAwaiter{}; }

			/// Keeps lambdas (and their captures) alive whose invocation produced this coroutine.
			std::unique_ptr<std::function<SimulationFunction<ReturnValue>()>> functorInstance;
		};
		using Handle = std::coroutine_handle<promise_type>;

		SimulationFunction() = default;
		SimulationFunction(const Handle &handle) : m_handle(handle), m_ref(handle) { }

		inline const Handle &getHandle() const { return m_handle; }
		inline const internal::CoroutineRef &getRef() const { return m_ref; }

		bool done() const { return m_ref.done(); }

		/**
		 * @brief Awaiter for suspending a coroutine until another finishes.
		 * @details Unless the coroutine to be joined has already finished, adds the calling coroutine to the list of coroutines awaiting final suspend of the one to be joined.
		 */
		struct Join {
			Handle called;
			internal::CoroutineRef calledRef;

			explicit Join(const SimulationFunction &function) noexcept : called(function.m_handle), calledRef(function.m_ref) { }

			bool await_ready() noexcept { return calledRef.done(); }
			void await_suspend(std::coroutine_handle<> callingSimulationCoroutine) noexcept {
				called.promise().awaitingFinalSuspend.push_back(callingSimulationCoroutine);
			}
			ReturnValue await_resume() {
				if constexpr (!std::is_void_v<ReturnValue>)
					return called.promise().returnValue;
			}
		};

		/// Runs the coroutine as a called sub-process of the co_awaiting coroutine.
		Join operator co_await() {
			CDCB_ASSERT_HINT(!m_ref.done(), "A simulation function can only be called once");
			m_ref.resume();
			return Join(*this);
		}
	protected:
		Handle m_handle = {};
		internal::CoroutineRef m_ref;
};


class SimulationCoroutineHandler {
	public:
		static thread_local SimulationCoroutineHandler *activeHandler;

		~SimulationCoroutineHandler();

		template<typename ReturnValue>
		void start(const SimulationFunction<ReturnValue> &function, bool runImmediate = false) {
			CDCB_ASSERT(!function.done());
			m_simulationCoroutines.emplace(function.getRef().rawHandle().address(), function.getRef());
			if (runImmediate)
				function.getRef().resume();
			else
				readyToResume(function.getRef().rawHandle());
		}
		void stopAll();

		void readyToResume(std::coroutine_handle<> handle) { m_coroutinesReadyToResume.push(handle); }
		/// Resumes ready coroutines until none is left. Exceptions thrown by coroutines propagate out of run().
		void run();

		void coroutineFinalSuspending(std::coroutine_handle<> handle);

		size_t numRunningProcesses() const { return m_simulationCoroutines.size(); }
	protected:
		std::map<void*, internal::CoroutineRef> m_simulationCoroutines;
		std::queue<std::coroutine_handle<>> m_coroutinesReadyToResume;
};


template<typename ReturnValue>
void SimulationFunction<ReturnValue>::promise_type::FinalSuspendAwaiter::await_suspend(std::coroutine_handle<promise_type> handle) noexcept {
	auto *handler = SimulationCoroutineHandler::activeHandler;
	for (const auto &coro : handle.promise().awaitingFinalSuspend)
		handler->readyToResume(coro);
	handle.promise().awaitingFinalSuspend.clear();
	// May destroy the coroutine frame if the handler held the last reference.
	handler->coroutineFinalSuspending(handle);
}


/// Starts a simulation function as an independent process and immediately runs it until its first suspension.
template<typename ReturnValue>
SimulationFunction<ReturnValue> fork(const SimulationFunction<ReturnValue> &simFunc)
{
	auto *handler = SimulationCoroutineHandler::activeHandler;
	CDCB_DESIGNCHECK_HINT(handler != nullptr, "fork() can only be called from within a running simulation process");
	handler->start(simFunc, true);
	return simFunc;
}

/// Invokes the functor and forks the resulting process. The functor is kept alive for as long as the process exists.
inline SimulationFunction<void> fork(std::function<SimulationFunction<void>()> &&functor)
{
	auto functorInstance = std::make_unique<std::function<SimulationFunction<void>()>>(std::move(functor));
	auto simFunc = (*functorInstance)();
	simFunc.getHandle().promise().functorInstance = std::move(functorInstance);

	return fork(simFunc);
}

/// Suspends until a forked process has finished.
template<typename ReturnValue>
typename SimulationFunction<ReturnValue>::Join join(const SimulationFunction<ReturnValue> &forked)
{
	return typename SimulationFunction<ReturnValue>::Join(forked);
}


extern template class SimulationFunction<void>;
extern template class SimulationFunction<bool>;

}

namespace cdcb {
	using SimProcess = sim::SimulationFunction<void>;
	template<typename ReturnValue = void>
	using SimFunction = sim::SimulationFunction<ReturnValue>;
}
