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
*	\file		test_settings.cpp
*	\brief		Tests of discovery settings
*
******************************************************************************/

#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "lib_error.hpp"
#include "settings.hpp"
#include "test_utilities.hpp"

using namespace std::literals;

namespace rfscout {

TEST(parse_subnet, bare_address_is_host_route) {
	EXPECT_EQ(settings::parse_subnet("192.168.1.20").to_string(), "192.168.1.20/32");
}

TEST(parse_subnet, host_bits_are_cleared) {
	EXPECT_EQ(settings::parse_subnet(" 10.1.2.3/24 ").to_string(), "10.1.2.0/24");
	EXPECT_EQ(settings::parse_subnet("172.16.5.9/255.255.0.0").to_string(), "172.16.0.0/16");
}

TEST(parse_subnet, invalid_entries_throw) {
	EXPECT_THROW(settings::parse_subnet("not-an-ip"), ex::invalid_argument);
	EXPECT_THROW(settings::parse_subnet("fe80::1/64"), ex::invalid_argument);
	EXPECT_THROW(settings::parse_subnet("10.0.0.0/33"), ex::invalid_argument);
	EXPECT_THROW(settings::parse_subnet("10.0.0.0/"), ex::invalid_argument);
	EXPECT_THROW(settings::parse_subnet("10.0.0.0/255.0.255.0"), ex::invalid_argument);
}

TEST(parse_subnet, too_broad_networks_are_rejected) {
	EXPECT_THROW(settings::parse_subnet("10.0.0.0/15"), ex::invalid_argument);
	EXPECT_EQ(settings::parse_subnet("10.0.0.0/16").prefix_length(), 16);
}

TEST(validate, defaults_on_empty_or_non_object) {
	const discovery_settings defaults;
	EXPECT_EQ(settings::validate(nlohmann::json::object()), defaults);
	EXPECT_EQ(settings::validate(nullptr), defaults);
	EXPECT_EQ(settings::validate(42), defaults);
	EXPECT_TRUE(defaults._auto);
	EXPECT_TRUE(defaults._subnets.empty());
	EXPECT_EQ(defaults._scan_interval_s, 60);
	EXPECT_EQ(defaults._timeout_ms, 750);
}

TEST(validate, subnets_are_normalized_and_deduplicated) {
	const auto raw = R"({
		"auto": false,
		"subnets": ["192.168.1.0/24", "192.168.1.77/24", "bogus", "fe80::/64", "10.0.0.0/8", "10.0.0.5"],
		"scan_interval": 120,
		"timeout_ms": 1000
	})"_json;

	const auto s = settings::validate(raw);

	EXPECT_FALSE(s._auto);
	EXPECT_EQ(s._subnets, (std::vector<std::string>{ "192.168.1.0/24", "10.0.0.5/32" }));
	EXPECT_EQ(s._scan_interval_s, 120);
	EXPECT_EQ(s._timeout_ms, 1000);
}

TEST(validate, subnets_as_delimited_string) {
	const auto s = settings::validate({ { "subnets", "10.0.0.0/24, 10.0.1.0/24\n10.0.0.0/24\r\n" } });
	EXPECT_EQ(s._subnets, (std::vector<std::string>{ "10.0.0.0/24", "10.0.1.0/24" }));
}

TEST(validate, scalars_are_clamped) {
	auto s = settings::validate({ { "scan_interval", 5 }, { "timeout_ms", 10 } });
	EXPECT_EQ(s._scan_interval_s, 15);
	EXPECT_EQ(s._timeout_ms, 100);

	s = settings::validate({ { "scan_interval", 100000 }, { "timeout_ms", 99999 } });
	EXPECT_EQ(s._scan_interval_s, 900);
	EXPECT_EQ(s._timeout_ms, 5000);
}

TEST(validate, numeric_strings_and_floats_are_accepted) {
	const auto s = settings::validate({ { "scan_interval", " 30 " }, { "timeout_ms", 250.9 } });
	EXPECT_EQ(s._scan_interval_s, 30);
	EXPECT_EQ(s._timeout_ms, 250);
}

TEST(validate, invalid_scalars_keep_defaults) {
	const auto s = settings::validate({ { "auto", "yes" }, { "scan_interval", "often" }, { "timeout_ms", true } });
	EXPECT_TRUE(s._auto);
	EXPECT_EQ(s._scan_interval_s, 60);
	EXPECT_EQ(s._timeout_ms, 750);
}

TEST(validate, to_json_uses_configuration_keys) {
	const auto j = nlohmann::json(settings::validate({ { "subnets", nlohmann::json::array({ "10.0.0.1" }) } }));
	EXPECT_EQ(j.at("auto"), true);
	EXPECT_EQ(j.at("subnets"), nlohmann::json::array({ "10.0.0.1/32" }));
	EXPECT_EQ(j.at("scan_interval"), 60);
	EXPECT_EQ(j.at("timeout_ms"), 750);
}

TEST(static_settings_provider, update_is_visible) {
	static_settings_provider provider;
	EXPECT_EQ(provider.get_discovery_settings(), nlohmann::json::object());
	provider.update({ { "auto", false } });
	EXPECT_FALSE(settings::validate(provider.get_discovery_settings())._auto);
}

TEST(json_file_settings_provider, reads_discovery_object) {
	test::temp_file config(".json");
	config.write(R"({ "other": 1, "discovery": { "auto": false, "subnets": ["10.2.0.0/24"] } })");
	const json_file_settings_provider provider(config.path());
	const auto s = settings::validate(provider.get_discovery_settings());
	EXPECT_FALSE(s._auto);
	EXPECT_EQ(s._subnets, std::vector<std::string>{ "10.2.0.0/24" });
}

TEST(json_file_settings_provider, missing_file_or_key_gives_empty_object) {
	const json_file_settings_provider missing("/nonexistent/rfscout/config.json");
	EXPECT_EQ(missing.get_discovery_settings(), nlohmann::json::object());

	test::temp_file config(".json");
	config.write(R"({ "other": 1 })");
	const json_file_settings_provider no_key(config.path());
	EXPECT_EQ(no_key.get_discovery_settings(), nlohmann::json::object());
}

TEST(json_file_settings_provider, invalid_file_throws) {
	test::temp_file config(".json");
	config.write("{ not json");
	const json_file_settings_provider provider(config.path());
	EXPECT_THROW(provider.get_discovery_settings(), ex::file_error);
}

} // namespace rfscout
