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
*	\file		settings.hpp
*	\brief		Discovery settings
*
******************************************************************************/

#ifndef RFSCOUT_INCLUDE_SETTINGS_HPP_
#define RFSCOUT_INCLUDE_SETTINGS_HPP_

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/ip/network_v4.hpp>
#include <boost/core/noncopyable.hpp>
#include <nlohmann/json.hpp>

#include "json/json_utilities.hpp"
#include "lib_definitions.hpp"

namespace rfscout {

struct discovery_settings {

	bool _auto{defaults::auto_detect};
	std::vector<std::string> _subnets;
	int _scan_interval_s{defaults::scan_interval_s};
	int _timeout_ms{defaults::timeout_ms};

	std::chrono::seconds scan_interval() const noexcept { return std::chrono::seconds{_scan_interval_s}; }
	std::chrono::milliseconds timeout() const noexcept { return std::chrono::milliseconds{_timeout_ms}; }

	static constexpr auto& key_auto() noexcept { return "auto"; }
	static constexpr auto& key_subnets() noexcept { return "subnets"; }
	static constexpr auto& key_scan_interval() noexcept { return "scan_interval"; }
	static constexpr auto& key_timeout_ms() noexcept { return "timeout_ms"; }

	friend bool operator==(const discovery_settings& lhs, const discovery_settings& rhs) noexcept {
		return lhs._auto == rhs._auto
			&& lhs._subnets == rhs._subnets
			&& lhs._scan_interval_s == rhs._scan_interval_s
			&& lhs._timeout_ms == rhs._timeout_ms;
	}

	friend void to_json(nlohmann::json& j, const discovery_settings& s) {
		json::set(j, key_auto(), s._auto);
		json::set(j, key_subnets(), s._subnets);
		json::set(j, key_scan_interval(), s._scan_interval_s);
		json::set(j, key_timeout_ms(), s._timeout_ms);
	}

};

namespace settings {

/**
 * Parse a subnet: bare IPv4 address (as /32) or CIDR notation. Host bits are cleared.
 * @throw ex::invalid_argument if the string is not valid, not IPv4, or broader than /16
 */
boost::asio::ip::network_v4 parse_subnet(const std::string& entry);

/**
 * Normalize and bound raw discovery settings. Never throws: invalid subnets are dropped,
 * invalid scalars fall back to defaults, out of range scalars are clamped.
 * @param raw	any JSON value, usually an object with keys auto, subnets, scan_interval, timeout_ms
 */
discovery_settings validate(const nlohmann::json& raw);

} // namespace settings

/**
 * Source of raw discovery settings, owned by the surrounding application.
 */
struct settings_provider {
	virtual ~settings_provider() = default;
	/**
	 * @return raw settings, to be validated by the caller
	 */
	virtual nlohmann::json get_discovery_settings() const = 0;
};

struct static_settings_provider final : public settings_provider, private boost::noncopyable {

	explicit static_settings_provider(nlohmann::json raw = nlohmann::json::object());

	nlohmann::json get_discovery_settings() const override;

	void update(nlohmann::json raw);

private:
	mutable std::mutex _mtx;
	nlohmann::json _raw;
};

/**
 * Read the "discovery" object of a JSON configuration file at every call, so that
 * changes made by the owner of the file are picked up on the next scan cycle.
 */
struct json_file_settings_provider final : public settings_provider {

	explicit json_file_settings_provider(std::string path);

	nlohmann::json get_discovery_settings() const override;

	static constexpr auto& key_discovery() noexcept { return "discovery"; }

private:
	const std::string _path;
};

} // namespace rfscout

#endif /* RFSCOUT_INCLUDE_SETTINGS_HPP_ */
