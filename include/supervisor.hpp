/******************************************************************************
*
*	RFScout - wireless receiver discovery
*
*******************************************************************************
*
*	Copyright (C) 2024 The RFScout Authors
*
*	This file is part of RFScout.
*
*	RFScout is free software; you can redistribute it and/or
*	modify it under the terms of the GNU Lesser General Public
*	License as published by the Free Software Foundation; either
*	version 3 of the License, or (at your option) any later version.
*
*	RFScout is distributed in the hope that it will be useful,
*	but WITHOUT ANY WARRANTY; without even the implied warranty of
*	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
*	Lesser General Public License for more details.
*
*	You should have received a copy of the GNU Lesser General Public
*	License along with RFScout; if not, see
*	https://www.gnu.org/licenses/.
*
*	SPDX-License-Identifier: LGPL-3.0-or-later
*
***************************************************************************//*!
*
*	\file		supervisor.hpp
*	\brief		Restart-forever wrapper
*
******************************************************************************/

#ifndef RFSCOUT_INCLUDE_SUPERVISOR_HPP_
#define RFSCOUT_INCLUDE_SUPERVISOR_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <boost/core/noncopyable.hpp>
#include <spdlog/spdlog.h>

#include "lib_error.hpp"
#include "library_logger.hpp"

namespace rfscout {

/**
 * Restart-forever wrapper: the supervised function is restarted after a fixed delay
 * whenever it throws, until a stop is requested.
 */
struct supervisor : private boost::noncopyable {

	using clock = std::chrono::steady_clock;

	supervisor(const std::string& name, clock::duration restart_delay)
	: _logger{library_logger::create_logger(name)}
	, _restart_delay{restart_delay}
	, _mtx{}
	, _cv{}
	, _stop{false}
	, _restarts{0} {}

	/**
	 * Run f until it returns or stop is requested.
	 *
	 * ex::stop thrown by f is considered a normal termination. Any other exception derived from
	 * std::exception is logged and f is invoked again after the restart delay.
	 */
	template <typename Function>
	void run(Function&& f) {
		while (!stop_requested()) {
			try {
				f();
				return;
			}
			catch (const ex::stop&) {
				return;
			}
			catch (const std::exception& ex) {
				_logger->error("{} crashed; restarting in {} ms: {}", _logger->name(), std::chrono::duration_cast<std::chrono::milliseconds>(_restart_delay).count(), ex.what());
				_logger->flush();
			}
			++_restarts;
			if (!wait_for(_restart_delay))
				return;
		}
	}

	/**
	 * Sleep, unless stop is requested in the meanwhile.
	 * @return false if stop has been requested
	 */
	template <typename Rep, typename Period>
	bool wait_for(const std::chrono::duration<Rep, Period>& duration) {
		std::unique_lock<std::mutex> lk{_mtx};
		return !_cv.wait_for(lk, duration, [this] { return _stop.load(); });
	}

	void request_stop() noexcept {
		{
			std::lock_guard<std::mutex> lk{_mtx};
			_stop = true;
		}
		_cv.notify_all();
	}

	void reset() noexcept {
		std::lock_guard<std::mutex> lk{_mtx};
		_stop = false;
	}

	bool stop_requested() const noexcept {
		return _stop;
	}

	std::size_t restarts() const noexcept {
		return _restarts;
	}

private:
	std::shared_ptr<spdlog::logger> _logger;
	const clock::duration _restart_delay;
	std::mutex _mtx;
	std::condition_variable _cv;
	std::atomic<bool> _stop;
	std::atomic<std::size_t> _restarts;
};

} // namespace rfscout

#endif /* RFSCOUT_INCLUDE_SUPERVISOR_HPP_ */
