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
*	\file		discovery_registry.hpp
*	\brief		Registry of discovered devices
*
******************************************************************************/

#ifndef RFSCOUT_INCLUDE_DISCOVERY_REGISTRY_HPP_
#define RFSCOUT_INCLUDE_DISCOVERY_REGISTRY_HPP_

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/core/noncopyable.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "json/json_utilities.hpp"

namespace rfscout {

using namespace std::string_literals;

enum struct discovery_source {
	PASSIVE,
	ACTIVE,
};

NLOHMANN_JSON_SERIALIZE_ENUM(discovery_source, {
	{ discovery_source::PASSIVE,		"passive"s		},
	{ discovery_source::ACTIVE,			"active"s		},
})

/**
 * Data reported by a single sighting. Empty optionals (and empty strings, and non-positive channel counts)
 * never overwrite what the registry already knows.
 */
struct device_fields {
	std::optional<std::string> _type;
	std::optional<int> _channels;
	std::optional<std::string> _model;
	std::optional<std::string> _band;
	std::optional<std::string> _class_id;
	discovery_source _source{discovery_source::PASSIVE};
	bool _reachable{true};
};

struct discovered_device {

	using time_point = std::chrono::system_clock::time_point;
	using age_type = std::chrono::duration<double>;

	std::string _address;
	std::string _type{"unknown"};
	int _channels{1};
	std::optional<std::string> _model;
	std::optional<std::string> _band;
	std::optional<std::string> _class_id;
	discovery_source _source{discovery_source::PASSIVE};
	bool _reachable{false};
	time_point _last_seen{};
	std::size_t _slot{0};
	std::optional<age_type> _age; // filled only on snapshot

	static constexpr auto& key_ip() noexcept { return "ip"; }
	static constexpr auto& key_slot() noexcept { return "slot"; }
	static constexpr auto& key_type() noexcept { return "type"; }
	static constexpr auto& key_channels() noexcept { return "channels"; }
	static constexpr auto& key_model() noexcept { return "model"; }
	static constexpr auto& key_band() noexcept { return "band"; }
	static constexpr auto& key_dcid() noexcept { return "dcid"; }
	static constexpr auto& key_source() noexcept { return "source"; }
	static constexpr auto& key_reachable() noexcept { return "reachable"; }
	static constexpr auto& key_timestamp() noexcept { return "timestamp"; }
	static constexpr auto& key_age() noexcept { return "age"; }

	friend void to_json(nlohmann::json& j, const discovered_device& d) {
		const auto timestamp = std::chrono::duration<double>(d._last_seen.time_since_epoch()).count();
		json::set(j, key_ip(), d._address);
		json::set(j, key_slot(), d._slot);
		json::set(j, key_type(), d._type);
		json::set(j, key_channels(), d._channels);
		json::set(j, key_model(), d._model);
		json::set(j, key_band(), d._band);
		json::set(j, key_dcid(), d._class_id);
		json::set(j, key_source(), d._source);
		json::set(j, key_reachable(), d._reachable);
		json::set(j, key_timestamp(), timestamp);
		if (d._age)
			json::set(j, key_age(), d._age->count());
	}

};

/**
 * Strict weak ordering of addresses: valid IPv4 addresses numerically, then anything else
 * lexicographically.
 */
bool address_less(const std::string& lhs, const std::string& rhs);

/**
 * Eviction window used after each active scan: a device is not evicted just because one scan missed it
 */
std::chrono::seconds eviction_ttl(std::chrono::seconds scan_interval);

struct discovery_registry : private boost::noncopyable {

	using time_point = discovered_device::time_point;
	using clock_function = std::function<time_point()>;

	discovery_registry();

	/**
	 * @param clock	time source, replaced by tests
	 */
	explicit discovery_registry(clock_function clock);

	/**
	 * Insert or merge a sighting. Slots are recomputed before returning.
	 */
	void upsert(const std::string& address, const device_fields& fields);

	/**
	 * Remove devices whose last sighting is older than ttl.
	 * @return the number of removed devices
	 */
	std::size_t prune(std::chrono::seconds ttl);

	/**
	 * Copy of the devices seen within ttl, annotated with their age. Registry is not modified.
	 */
	std::vector<discovered_device> snapshot(std::chrono::seconds ttl) const;

	nlohmann::json snapshot_json(std::chrono::seconds ttl) const;

	/**
	 * Copy of all the devices, with no age filtering
	 */
	std::vector<discovered_device> devices() const;

	std::optional<discovered_device> find(const std::string& address) const;

	std::size_t size() const;

	void clear();

private:

	void assign_slots();

	std::shared_ptr<spdlog::logger> _logger;
	const clock_function _clock;
	mutable std::mutex _mtx;
	std::vector<discovered_device> _devices;

};

} // namespace rfscout

#endif /* RFSCOUT_INCLUDE_DISCOVERY_REGISTRY_HPP_ */
