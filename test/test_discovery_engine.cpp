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
*	\file		test_discovery_engine.cpp
*	\brief		Tests of discovery_engine
*
******************************************************************************/

#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "device_class_database.hpp"
#include "discovery_engine.hpp"
#include "settings.hpp"
#include "test_utilities.hpp"

using namespace std::literals;

namespace rfscout {

TEST(discovery_engine, loads_database_at_construction) {
	device_class_database db;
	test::load_sample_database(db);
	test::temp_file dcid(".json");
	db.save_to_file(dcid.path());

	const static_settings_provider provider(nlohmann::json{ { "auto", false } });
	discovery_engine engine(provider, dcid.path());

	EXPECT_EQ(engine.database().size(), 4U);
	const auto status = engine.dcid_status();
	EXPECT_EQ(status.at("loaded"), true);
	EXPECT_EQ(status.at("source"), dcid.path());
}

TEST(discovery_engine, runs_without_database) {
	const static_settings_provider provider(nlohmann::json{ { "auto", false } });
	discovery_engine engine(provider, "/nonexistent/rfscout/dcid.json"s);

	EXPECT_EQ(engine.database().size(), 0U);
	EXPECT_EQ(engine.dcid_status().at("loaded"), false);
	EXPECT_TRUE(engine.dcid_status().at("message").is_string());
}

TEST(discovery_engine, corrupted_database_is_not_fatal) {
	test::temp_file dcid(".json");
	dcid.write("{ broken");

	const static_settings_provider provider(nlohmann::json{ { "auto", false } });
	discovery_engine engine(provider, dcid.path());

	EXPECT_EQ(engine.dcid_status().at("loaded"), false);
}

TEST(discovery_engine, scan_once_on_silent_network) {
	const static_settings_provider provider(nlohmann::json{
		{ "auto", false },
		{ "subnets", nlohmann::json::array({ "127.0.0.0/30" }) },
		{ "timeout_ms", 100 },
	});
	discovery_engine engine(provider);

	EXPECT_NO_THROW(EXPECT_EQ(engine.scan_once(), 0U));
	const auto discovered = engine.discovered();
	ASSERT_TRUE(discovered.is_array());
	EXPECT_TRUE(discovered.empty());
}

TEST(discovery_engine, discovered_reports_passive_sightings) {
	const static_settings_provider provider(nlohmann::json{ { "auto", false } });
	discovery_engine engine(provider);

	device_fields f;
	f._model = "ULXD4"s;
	engine.registry().upsert("10.0.0.30", f);
	engine.registry().upsert("10.0.0.4", device_fields{});

	const auto discovered = engine.discovered();
	ASSERT_EQ(discovered.size(), 2U);
	EXPECT_EQ(discovered[0].at("ip"), "10.0.0.4");
	EXPECT_EQ(discovered[0].at("slot"), 1);
	EXPECT_EQ(discovered[1].at("ip"), "10.0.0.30");
	EXPECT_EQ(discovered[1].at("model"), "ULXD4");
	EXPECT_EQ(discovered[1].at("source"), "passive");
}

} // namespace rfscout
