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
*	\file		discovery_engine.cpp
*	\brief		Discovery subsystem
*
******************************************************************************/

#include "discovery_engine.hpp"

#include <fstream>

#include "lib_error.hpp"
#include "library_logger.hpp"

using namespace std::literals;

namespace rfscout {

discovery_engine::discovery_engine(const settings_provider& provider, const std::optional<std::string>& dcid_path)
: _logger{library_logger::create_logger("discovery"s)}
, _db{}
, _registry{}
, _listener(_db, _registry)
, _prober(_db, _registry)
, _scheduler(provider, _listener, _prober, _registry) {
	load_database(dcid_path);
}

discovery_engine::~discovery_engine() {
	try {
		stop();
	}
	catch (const std::exception& ex) {
		_logger->error("stop failed: {}", ex.what());
	}
}

void discovery_engine::start() {
	_scheduler.start();
}

void discovery_engine::stop() {
	_scheduler.stop();
}

void discovery_engine::run() {
	_scheduler.run();
}

std::size_t discovery_engine::scan_once() {
	return _scheduler.run_cycle_once();
}

nlohmann::json discovery_engine::discovered(std::chrono::seconds ttl) const {
	return _registry.snapshot_json(ttl);
}

nlohmann::json discovery_engine::dcid_status() const {
	return _db.status();
}

void discovery_engine::load_database(const std::optional<std::string>& dcid_path) {
	if (dcid_path && std::ifstream(*dcid_path).good()) {
		try {
			_db.restore_from_file(*dcid_path);
			SPDLOG_LOGGER_DEBUG(_logger, "loaded {} DCID entries from {}", _db.size(), *dcid_path);
		}
		catch (const ex::file_error& ex) {
			// discovery goes on without classification
			_logger->warn("failed to load DCID map from {}: {}", *dcid_path, ex.what());
		}
	}
	_db.refresh_status(dcid_path);
}

} // namespace rfscout
