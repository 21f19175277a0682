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
*	\file		scan_scheduler.cpp
*	\brief		Discovery loop
*
******************************************************************************/

#include "scan_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "cpp-utility/scope_exit.hpp"
#include "lib_error.hpp"
#include "library_logger.hpp"

using namespace std::literals;

namespace rfscout {

scan_scheduler::scan_scheduler(const settings_provider& provider, passive_listener& listener, active_prober& prober, discovery_registry& registry)
: scan_scheduler(provider, listener, prober, registry, std::chrono::duration_cast<std::chrono::milliseconds>(timing::restart_delay)) {
}

scan_scheduler::scan_scheduler(const settings_provider& provider, passive_listener& listener, active_prober& prober, discovery_registry& registry, std::chrono::milliseconds restart_delay)
: _logger{library_logger::create_logger("scheduler"s)}
, _provider(provider)
, _listener(listener)
, _prober(prober)
, _registry(registry)
, _supervisor("discovery loop"s, restart_delay)
, _state{scheduler_state::IDLE}
, _cycles{0}
, _thread{} {
}

scan_scheduler::~scan_scheduler() {
	try {
		stop();
	}
	catch (const std::exception& ex) {
		_logger->error("stop failed: {}", ex.what());
	}
}

void scan_scheduler::start() {
	if (_thread.joinable())
		throw "discovery already running"_ex;
	_supervisor.reset();
	_prober.reset();
	_thread = std::thread([this] { run(); });
}

void scan_scheduler::stop() {
	_supervisor.request_stop();
	_prober.stop();
	_listener.interrupt();
	if (_thread.joinable()) {
		SPDLOG_LOGGER_DEBUG(_logger, "joining discovery thread");
		_thread.join();
	}
	set_state(scheduler_state::STOPPED);
}

void scan_scheduler::run() {
	_logger->info("discovery started");
	_supervisor.run([this] {
		try {
			run_loop();
		}
		catch (const ex::stop&) {
			throw;
		}
		catch (const std::exception&) {
			set_state(scheduler_state::RESTARTING);
			throw;
		}
	});
	set_state(scheduler_state::STOPPED);
	_logger->info("discovery stopped");
}

std::size_t scan_scheduler::run_cycle_once() {
	const auto found = run_cycle(current_settings());
	set_state(scheduler_state::IDLE);
	return found;
}

discovery_settings scan_scheduler::current_settings() const {
	try {
		return settings::validate(_provider.get_discovery_settings());
	}
	catch (const std::exception& ex) {
		_logger->debug("falling back to default discovery settings: {}", ex.what());
		return discovery_settings{};
	}
}

scheduler_state scan_scheduler::state() const noexcept {
	return _state;
}

bool scan_scheduler::is_running() const noexcept {
	return _thread.joinable() && !_supervisor.stop_requested();
}

std::size_t scan_scheduler::completed_cycles() const noexcept {
	return _cycles;
}

std::size_t scan_scheduler::restarts() const noexcept {
	return _supervisor.restarts();
}

void scan_scheduler::run_loop() {

	using clock = std::chrono::steady_clock;

	// failure here is fatal for this iteration only: the supervisor will retry
	_listener.open();
	const auto close_listener = make_scope_exit([this]() noexcept { _listener.close(); });

	set_state(scheduler_state::LISTENING);

	// first scan as soon as possible
	auto next_scan_at = clock::now();

	while (!_supervisor.stop_requested()) {

		const auto config = current_settings();

		const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(next_scan_at - clock::now());

		if (remaining > std::chrono::milliseconds::zero()) {
			const auto timeout = std::min<std::chrono::milliseconds>(timing::listen_timeout, remaining);
			try {
				_listener.receive_for(timeout);
			}
			catch (const ex::socket_error& ex) {
				_logger->warn("multicast socket error: {}", ex.what());
				if (!_supervisor.wait_for(timing::socket_error_pause))
					break;
				continue;
			}
		}

		if (_supervisor.stop_requested())
			break;

		if (clock::now() >= next_scan_at) {
			run_cycle(config);
			set_state(scheduler_state::LISTENING);
			next_scan_at = clock::now() + std::max<std::chrono::seconds>(config.scan_interval(), std::chrono::seconds{limits::min_scan_interval_s});
		}

	}
}

std::size_t scan_scheduler::run_cycle(const discovery_settings& config) {

	set_state(scheduler_state::SCANNING);

	std::size_t found{};
	try {
		found = _prober.scan(config);
	}
	catch (const ex::stop&) {
		throw;
	}
	catch (const std::exception& ex) {
		_logger->error("active discovery scan failed: {}", ex.what());
	}

	_registry.prune(eviction_ttl(config.scan_interval()));

	++_cycles;

	return found;
}

void scan_scheduler::set_state(scheduler_state state) noexcept {
	_state = state;
}

} // namespace rfscout
