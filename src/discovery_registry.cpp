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
*	\file		discovery_registry.cpp
*	\brief		Registry of discovered devices
*
******************************************************************************/

#include "discovery_registry.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include <boost/asio/ip/address_v4.hpp>

#include "lib_definitions.hpp"
#include "library_logger.hpp"

using namespace std::literals;

namespace rfscout {

namespace {

std::optional<std::uint32_t> to_numeric_address(const std::string& address) {
	boost::system::error_code ec;
	const auto a = boost::asio::ip::make_address_v4(address, ec);
	if (ec)
		return std::nullopt;
	return a.to_uint();
}

bool has_value(const std::optional<std::string>& v) noexcept {
	return v && !v->empty();
}

bool has_value(const std::optional<int>& v) noexcept {
	return v && *v > 0;
}

template <typename T, typename U>
void merge_if_not_empty(T& target, const std::optional<U>& value) {
	if (has_value(value))
		target = *value;
}

} // unnamed namespace

bool address_less(const std::string& lhs, const std::string& rhs) {
	const auto l = to_numeric_address(lhs);
	const auto r = to_numeric_address(rhs);
	if (l && r)
		return *l < *r;
	if (l || r)
		return static_cast<bool>(l); // valid before invalid
	return lhs < rhs;
}

std::chrono::seconds eviction_ttl(std::chrono::seconds scan_interval) {
	return std::max<std::chrono::seconds>(scan_interval * timing::ttl_scan_multiplier, timing::active_scan_ttl);
}

discovery_registry::discovery_registry()
: discovery_registry([] { return std::chrono::system_clock::now(); }) {
}

discovery_registry::discovery_registry(clock_function clock)
: _logger{library_logger::create_logger("registry"s)}
, _clock{std::move(clock)}
, _mtx{}
, _devices{} {
}

void discovery_registry::upsert(const std::string& address, const device_fields& fields) {

	const auto now = _clock();

	std::lock_guard<std::mutex> lk{_mtx};

	auto it = std::find_if(_devices.begin(), _devices.end(), [&address](const discovered_device& d) {
		return d._address == address;
	});

	if (it == _devices.end()) {
		discovered_device d;
		d._address = address;
		_devices.emplace_back(std::move(d));
		it = std::prev(_devices.end());
		_logger->info("new device {} ({})", address, json::to_json_string(fields._source));
	}

	auto& d = *it;
	merge_if_not_empty(d._type, fields._type);
	merge_if_not_empty(d._channels, fields._channels);
	merge_if_not_empty(d._model, fields._model);
	merge_if_not_empty(d._band, fields._band);
	merge_if_not_empty(d._class_id, fields._class_id);
	d._source = fields._source;
	d._reachable = fields._reachable;
	d._last_seen = now;

	assign_slots();
}

std::size_t discovery_registry::prune(std::chrono::seconds ttl) {

	const auto cutoff = _clock() - ttl;

	std::lock_guard<std::mutex> lk{_mtx};

	const auto before = _devices.size();
	_devices.erase(std::remove_if(_devices.begin(), _devices.end(), [cutoff](const discovered_device& d) {
		return d._last_seen < cutoff;
	}), _devices.end());
	const auto removed = before - _devices.size();

	if (removed != 0) {
		assign_slots();
		SPDLOG_LOGGER_DEBUG(_logger, "pruned {} stale discovery entries", removed);
	}

	return removed;
}

std::vector<discovered_device> discovery_registry::snapshot(std::chrono::seconds ttl) const {

	const auto now = _clock();
	const auto cutoff = now - ttl;

	std::vector<discovered_device> res;

	std::lock_guard<std::mutex> lk{_mtx};
	std::copy_if(_devices.begin(), _devices.end(), std::back_inserter(res), [cutoff](const discovered_device& d) {
		return d._last_seen >= cutoff;
	});
	for (auto& d : res)
		d._age = std::max(discovered_device::age_type{now - d._last_seen}, discovered_device::age_type::zero());

	return res;
}

nlohmann::json discovery_registry::snapshot_json(std::chrono::seconds ttl) const {
	return snapshot(ttl);
}

std::vector<discovered_device> discovery_registry::devices() const {
	std::lock_guard<std::mutex> lk{_mtx};
	return _devices;
}

std::optional<discovered_device> discovery_registry::find(const std::string& address) const {
	std::lock_guard<std::mutex> lk{_mtx};
	const auto it = std::find_if(_devices.begin(), _devices.end(), [&address](const discovered_device& d) {
		return d._address == address;
	});
	if (it == _devices.end())
		return std::nullopt;
	return *it;
}

std::size_t discovery_registry::size() const {
	std::lock_guard<std::mutex> lk{_mtx};
	return _devices.size();
}

void discovery_registry::clear() {
	std::lock_guard<std::mutex> lk{_mtx};
	_devices.clear();
}

// to be called with _mtx locked
void discovery_registry::assign_slots() {
	std::stable_sort(_devices.begin(), _devices.end(), [](const discovered_device& lhs, const discovered_device& rhs) {
		return address_less(lhs._address, rhs._address);
	});
	std::size_t slot{1};
	for (auto& d : _devices)
		d._slot = slot++;
}

} // namespace rfscout
