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
*	\file		settings.cpp
*	\brief		Discovery settings
*
******************************************************************************/

#include "settings.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <optional>
#include <set>
#include <utility>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/lexical_cast.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "lib_error.hpp"
#include "library_logger.hpp"

using namespace std::literals;

namespace rfscout {

namespace settings {

namespace {

std::shared_ptr<spdlog::logger> logger() {
	static const auto instance = library_logger::create_logger("settings"s);
	return instance;
}

unsigned int parse_prefix(const std::string& prefix) {
	// netmask notation, e.g. 255.255.255.0
	if (prefix.find('.') != std::string::npos) {
		boost::system::error_code ec;
		const auto mask = boost::asio::ip::make_address_v4(prefix, ec);
		if (ec)
			throw ex::invalid_argument(fmt::format("invalid netmask {}", prefix));
		const auto bits = mask.to_uint();
		const auto inverted = ~bits;
		// contiguous if inverted is 2^n - 1
		if ((inverted & (inverted + 1)) != 0)
			throw ex::invalid_argument(fmt::format("non contiguous netmask {}", prefix));
		unsigned int len{};
		for (auto b = bits; b != 0; b <<= 1)
			++len;
		return len;
	}
	unsigned int len{};
	if (prefix.empty() || !boost::conversion::try_lexical_convert(prefix, len) || len > 32)
		throw ex::invalid_argument(fmt::format("invalid prefix length {}", prefix));
	return len;
}

std::vector<std::string> subnet_candidates(const nlohmann::json& field) {
	std::vector<std::string> res;
	if (field.is_string()) {
		auto s = field.get<std::string>();
		boost::replace_all(s, ",", "\n");
		boost::split(res, s, boost::is_any_of("\r\n"));
	} else if (field.is_array()) {
		for (const auto& entry : field) {
			if (entry.is_null())
				continue;
			res.emplace_back(entry.is_string() ? entry.get<std::string>() : entry.dump());
		}
	}
	return res;
}

std::vector<std::string> normalized_subnet_list(const nlohmann::json& field) {
	std::vector<std::string> res;
	std::set<std::string> seen;
	for (auto candidate : subnet_candidates(field)) {
		boost::trim(candidate);
		if (candidate.empty())
			continue;
		std::string key;
		try {
			key = parse_subnet(candidate).to_string();
		}
		catch (const ex::invalid_argument& ex) {
			logger()->warn("discovery subnet '{}' ignored: {}", candidate, ex.what());
			continue;
		}
		if (seen.insert(key).second)
			res.emplace_back(std::move(key));
	}
	return res;
}

std::optional<long long> to_integer(const nlohmann::json& value) {
	if (value.is_number_unsigned()) {
		const auto v = value.get<unsigned long long>();
		return static_cast<long long>(std::min<unsigned long long>(v, std::numeric_limits<long long>::max()));
	}
	if (value.is_number_integer())
		return value.get<long long>();
	if (value.is_number_float()) {
		const auto v = value.get<double>();
		if (!std::isfinite(v))
			return std::nullopt;
		if (v >= static_cast<double>(std::numeric_limits<long long>::max()))
			return std::numeric_limits<long long>::max();
		if (v <= static_cast<double>(std::numeric_limits<long long>::min()))
			return std::numeric_limits<long long>::min();
		return static_cast<long long>(std::trunc(v));
	}
	if (value.is_string()) {
		const auto s = boost::trim_copy(value.get<std::string>());
		long long v{};
		if (boost::conversion::try_lexical_convert(s, v))
			return v;
	}
	return std::nullopt;
}

void bounded_integer(const nlohmann::json& raw, const char* key, int min, int max, int& target) {
	const auto it = raw.find(key);
	if (it == raw.end() || it->is_null())
		return;
	const auto value = to_integer(*it);
	if (!value) {
		logger()->warn("invalid discovery {} '{}'", key, it->dump());
		return;
	}
	target = static_cast<int>(std::clamp<long long>(*value, min, max));
}

} // unnamed namespace

boost::asio::ip::network_v4 parse_subnet(const std::string& entry) {

	const auto candidate = boost::trim_copy(entry);
	const auto slash = candidate.find('/');
	const auto address_part = candidate.substr(0, slash);

	boost::system::error_code ec;
	const auto address = boost::asio::ip::make_address(address_part, ec);
	if (ec)
		throw ex::invalid_argument(fmt::format("invalid address {}", address_part));
	if (!address.is_v4())
		throw ex::invalid_argument("not IPv4"s);

	const auto prefix = (slash == std::string::npos) ? 32U : parse_prefix(candidate.substr(slash + 1));

	const auto network = boost::asio::ip::network_v4(address.to_v4(), static_cast<unsigned short>(prefix)).canonical();

	if (network.prefix_length() < limits::min_prefix_length)
		throw ex::invalid_argument(fmt::format("{} is too broad; minimum /{}", network.to_string(), limits::min_prefix_length));

	return network;
}

discovery_settings validate(const nlohmann::json& raw) {

	discovery_settings res;

	if (!raw.is_object())
		return res;

	const auto auto_it = raw.find(discovery_settings::key_auto());
	if (auto_it != raw.end() && auto_it->is_boolean())
		res._auto = auto_it->get<bool>();

	const auto subnets_it = raw.find(discovery_settings::key_subnets());
	if (subnets_it != raw.end())
		res._subnets = normalized_subnet_list(*subnets_it);

	bounded_integer(raw, discovery_settings::key_scan_interval(), limits::min_scan_interval_s, limits::max_scan_interval_s, res._scan_interval_s);
	bounded_integer(raw, discovery_settings::key_timeout_ms(), limits::min_timeout_ms, limits::max_timeout_ms, res._timeout_ms);

	return res;
}

} // namespace settings

static_settings_provider::static_settings_provider(nlohmann::json raw)
: _mtx{}
, _raw(std::move(raw)) {
}

nlohmann::json static_settings_provider::get_discovery_settings() const {
	std::lock_guard<std::mutex> lk{_mtx};
	return _raw;
}

void static_settings_provider::update(nlohmann::json raw) {
	std::lock_guard<std::mutex> lk{_mtx};
	_raw = std::move(raw);
}

json_file_settings_provider::json_file_settings_provider(std::string path)
: _path(std::move(path)) {
}

nlohmann::json json_file_settings_provider::get_discovery_settings() const {
	std::ifstream in(_path);
	if (!in)
		return nlohmann::json::object();
	const auto config = nlohmann::json::parse(in, nullptr, false);
	if (config.is_discarded() || !config.is_object())
		throw ex::file_error(fmt::format("invalid configuration file {}", _path));
	const auto it = config.find(key_discovery());
	if (it == config.end())
		return nlohmann::json::object();
	return *it;
}

} // namespace rfscout
