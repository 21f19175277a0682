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
*	\file		scan_scheduler.hpp
*	\brief		Discovery loop
*
******************************************************************************/

#ifndef RFSCOUT_INCLUDE_SCAN_SCHEDULER_HPP_
#define RFSCOUT_INCLUDE_SCAN_SCHEDULER_HPP_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <thread>

#include <boost/core/noncopyable.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "active_prober.hpp"
#include "discovery_registry.hpp"
#include "lib_definitions.hpp"
#include "passive_listener.hpp"
#include "settings.hpp"
#include "supervisor.hpp"

namespace rfscout {

using namespace std::string_literals;

enum struct scheduler_state {
	IDLE,
	LISTENING,
	SCANNING,
	RESTARTING,
	STOPPED,
};

NLOHMANN_JSON_SERIALIZE_ENUM(scheduler_state, {
	{ scheduler_state::IDLE,			"idle"s			},
	{ scheduler_state::LISTENING,		"listening"s	},
	{ scheduler_state::SCANNING,		"scanning"s		},
	{ scheduler_state::RESTARTING,		"restarting"s	},
	{ scheduler_state::STOPPED,			"stopped"s		},
})

/**
 * Top level discovery loop: passive listening interleaved with periodic active scans,
 * on a single worker thread, restarted forever on failure.
 */
struct scan_scheduler : private boost::noncopyable {

	scan_scheduler(const settings_provider& provider, passive_listener& listener, active_prober& prober, discovery_registry& registry);

	/**
	 * @param restart_delay	delay before restarting the loop after a failure
	 */
	scan_scheduler(const settings_provider& provider, passive_listener& listener, active_prober& prober, discovery_registry& registry, std::chrono::milliseconds restart_delay);

	~scan_scheduler();

	/**
	 * Spawn the worker thread.
	 * @throw ex::runtime_error if already running
	 */
	void start();

	/**
	 * Stop the worker thread, interrupting the current scan, and join it. Idempotent.
	 */
	void stop();

	/**
	 * Run the supervised loop on the calling thread, until stop() is invoked from another thread.
	 */
	void run();

	/**
	 * Run a single active scan cycle (scan and prune) synchronously.
	 * @return the number of devices that answered
	 * @throw ex::stop if stopped in the meanwhile
	 */
	std::size_t run_cycle_once();

	/**
	 * Current settings from the provider, validated. Defaults if the provider fails.
	 */
	discovery_settings current_settings() const;

	scheduler_state state() const noexcept;

	bool is_running() const noexcept;

	std::size_t completed_cycles() const noexcept;

	std::size_t restarts() const noexcept;

private:

	void run_loop();
	std::size_t run_cycle(const discovery_settings& config);
	void set_state(scheduler_state state) noexcept;

	std::shared_ptr<spdlog::logger> _logger;
	const settings_provider& _provider;
	passive_listener& _listener;
	active_prober& _prober;
	discovery_registry& _registry;
	supervisor _supervisor;
	std::atomic<scheduler_state> _state;
	std::atomic<std::size_t> _cycles;
	std::thread _thread;

};

} // namespace rfscout

#endif /* RFSCOUT_INCLUDE_SCAN_SCHEDULER_HPP_ */
