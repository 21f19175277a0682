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
*	\file		periodic_task.hpp
*	\brief		Task repeated on a Boost.Asio timer
*
******************************************************************************/

#ifndef RFSCOUT_INCLUDE_PERIODIC_TASK_HPP_
#define RFSCOUT_INCLUDE_PERIODIC_TASK_HPP_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/core/noncopyable.hpp>
#include <spdlog/spdlog.h>

#include "library_logger.hpp"

namespace rfscout {

/**
 * Invokes a task every interval on the thread running the io_context, until stop() is called.
 *
 * A completion already queued when stop() is called neither invokes the task nor reschedules
 * the timer, so io_context::run() can return.
 */
struct periodic_task : private boost::noncopyable {

	periodic_task(const std::string& name, boost::asio::io_context& ctx, std::chrono::milliseconds interval, std::function<void()> task)
	: _logger{library_logger::create_logger(name)}
	, _timer{ctx}
	, _interval{interval}
	, _task{std::move(task)}
	, _stopped{false}
	, _runs{0} {}

	/**
	 * Schedule the first run after one interval. Does nothing if the interval is negative.
	 */
	void start() {
		if (_interval < std::chrono::milliseconds::zero())
			return;
		_stopped = false;
		schedule();
	}

	/**
	 * Safe to call from any thread, and from within the task.
	 */
	void stop() {
		_stopped = true;
		boost::asio::post(_timer.get_executor(), [this] { _timer.cancel(); });
	}

	bool stopped() const noexcept {
		return _stopped;
	}

	std::size_t runs() const noexcept {
		return _runs;
	}

private:

	void schedule() {
		_timer.expires_after(_interval);
		_timer.async_wait([this](const boost::system::error_code& ec) {
			if (ec || _stopped)
				return;
			++_runs;
			try {
				_task();
			}
			catch (const std::exception& ex) {
				_logger->error("{} failed: {}", _logger->name(), ex.what());
			}
			if (!_stopped)
				schedule();
		});
	}

	std::shared_ptr<spdlog::logger> _logger;
	boost::asio::steady_timer _timer;
	const std::chrono::milliseconds _interval;
	const std::function<void()> _task;
	std::atomic<bool> _stopped;
	std::atomic<std::size_t> _runs;
};

} // namespace rfscout

#endif /* RFSCOUT_INCLUDE_PERIODIC_TASK_HPP_ */
