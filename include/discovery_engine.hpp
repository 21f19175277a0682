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
*	\file		discovery_engine.hpp
*	\brief		Discovery subsystem
*
******************************************************************************/

#ifndef RFSCOUT_INCLUDE_DISCOVERY_ENGINE_HPP_
#define RFSCOUT_INCLUDE_DISCOVERY_ENGINE_HPP_

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <boost/core/noncopyable.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "active_prober.hpp"
#include "device_class_database.hpp"
#include "discovery_registry.hpp"
#include "lib_definitions.hpp"
#include "passive_listener.hpp"
#include "scan_scheduler.hpp"
#include "settings.hpp"

namespace rfscout {

/**
 * The discovery subsystem, one instance per process: owns the device class database,
 * the registry and the workers, and exposes the results to the dashboard.
 */
struct discovery_engine : private boost::noncopyable {

	/**
	 * @param provider	source of discovery settings, must outlive the engine
	 * @param dcid_path	device class database in JSON format, restored at construction if present
	 */
	explicit discovery_engine(const settings_provider& provider, const std::optional<std::string>& dcid_path = std::nullopt);

	~discovery_engine();

	void start();

	void stop();

	/**
	 * Run discovery on the calling thread until stop() is called from another thread
	 */
	void run();

	/**
	 * Single active scan cycle with current settings
	 * @return the number of devices that answered
	 */
	std::size_t scan_once();

	/**
	 * Devices seen within ttl, ordered by slot, as JSON array
	 */
	nlohmann::json discovered(std::chrono::seconds ttl = timing::active_scan_ttl) const;

	/**
	 * Device class database health, as JSON object
	 */
	nlohmann::json dcid_status() const;

	device_class_database& database() noexcept { return _db; }
	discovery_registry& registry() noexcept { return _registry; }
	scan_scheduler& scheduler() noexcept { return _scheduler; }

private:

	void load_database(const std::optional<std::string>& dcid_path);

	std::shared_ptr<spdlog::logger> _logger;
	device_class_database _db;
	discovery_registry _registry;
	passive_listener _listener;
	active_prober _prober;
	scan_scheduler _scheduler;

};

} // namespace rfscout

#endif /* RFSCOUT_INCLUDE_DISCOVERY_ENGINE_HPP_ */
