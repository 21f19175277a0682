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
*	\file		test_device_class_database.cpp
*	\brief		Tests of device_class_database
*
******************************************************************************/

#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "classification.hpp"
#include "device_class_database.hpp"
#include "lib_error.hpp"
#include "test_utilities.hpp"

using namespace std::literals;

namespace rfscout {

TEST(device_class_database, load_vendor_xml_skips_malformed_records) {
	device_class_database db;
	test::temp_file xml(".xml");
	xml.write(test::sample_dcid_map_xml());

	EXPECT_EQ(db.load(xml.path()), 4U);
	EXPECT_EQ(db.size(), 4U);
	EXPECT_FALSE(db.contains("DEAD"));

	const auto e = db.lookup_by_class_id("AB13");
	ASSERT_TRUE(e);
	EXPECT_EQ(e->_class_id, "AB13");
	EXPECT_EQ(e->_model_key, "ULXD4D");
	EXPECT_EQ(e->_model_name, "ULXD4D Digital Wireless Receiver");
	EXPECT_EQ(e->_band, "H50");
}

TEST(device_class_database, load_missing_or_malformed_file_throws) {
	device_class_database db;
	EXPECT_THROW(db.load("/nonexistent/rfscout/DCIDMap.xml"), ex::file_error);

	test::temp_file xml(".xml");
	xml.write("<DCIDMap><MapEntry>");
	EXPECT_THROW(db.load(xml.path()), ex::file_error);
	EXPECT_EQ(db.size(), 0U);
}

TEST(device_class_database, display_name_falls_back_on_model_key) {
	device_class_database db;
	test::load_sample_database(db);
	const auto e = db.lookup_by_class_id("QX01");
	ASSERT_TRUE(e);
	EXPECT_EQ(e->display_name(), "QLXD4");
}

TEST(device_class_database, save_and_restore) {
	device_class_database db;
	test::load_sample_database(db);

	test::temp_file json_file(".json");
	db.save_to_file(json_file.path());

	const auto j = nlohmann::json::parse(json_file.read());
	ASSERT_TRUE(j.is_object());
	EXPECT_EQ(j.size(), 4U);
	EXPECT_EQ(j.at("AB12").at("model"), "ULXD4D");
	EXPECT_EQ(j.at("AB12").at("band"), "G50");
	EXPECT_EQ(j.at("QX01").at("model_name"), "");

	device_class_database restored;
	restored.restore_from_file(json_file.path());
	EXPECT_EQ(restored.entries(), db.entries());
}

TEST(device_class_database, restore_skips_invalid_records) {
	test::temp_file json_file(".json");
	json_file.write(R"({ "AB12": { "model": "ULXD4D", "model_name": "ULXD4D", "band": "G50" }, "BAD1": "string", "BAD2": 3 })");

	device_class_database db;
	db.restore_from_file(json_file.path());
	EXPECT_EQ(db.size(), 1U);
	EXPECT_TRUE(db.contains("AB12"));
}

TEST(device_class_database, failed_restore_keeps_previous_mapping) {
	device_class_database db;
	test::load_sample_database(db);

	test::temp_file json_file(".json");
	json_file.write("[1, 2, 3]");
	EXPECT_THROW(db.restore_from_file(json_file.path()), ex::file_error);
	json_file.write("{ broken");
	EXPECT_THROW(db.restore_from_file(json_file.path()), ex::file_error);
	EXPECT_THROW(db.restore_from_file("/nonexistent/rfscout/dcid.json"), ex::file_error);

	EXPECT_EQ(db.size(), 4U);
}

TEST(device_class_database, convert_writes_json) {
	test::temp_file xml(".xml");
	xml.write(test::sample_dcid_map_xml());
	test::temp_file json_file(".json");

	device_class_database db;
	EXPECT_EQ(db.convert(xml.path(), json_file.path()), 4U);

	device_class_database restored;
	restored.restore_from_file(json_file.path());
	EXPECT_EQ(restored.size(), 4U);
}

TEST(device_class_database, status) {
	device_class_database db;
	EXPECT_FALSE(db.status().loaded());

	db.refresh_status(std::nullopt);
	EXPECT_FALSE(db.status().loaded());
	EXPECT_NE(db.status()._message.find("DCID map"), std::string::npos);

	test::load_sample_database(db);
	db.refresh_status("dcid.json"s);
	const auto s = db.status();
	EXPECT_TRUE(s.loaded());
	EXPECT_EQ(s._state, database_state::LOADED);
	EXPECT_EQ(s._source, "dcid.json"s);

	const nlohmann::json j = s;
	EXPECT_EQ(j.at("loaded"), true);
	EXPECT_EQ(j.at("source"), "dcid.json");
	EXPECT_TRUE(j.at("message").is_string());

	db.clear();
	db.refresh_status(std::nullopt);
	EXPECT_FALSE(db.status().loaded());
}

TEST(device_class_database, lookup_model_by_name) {
	const auto ad4q = device_class_database::lookup_model_by_name("AD4Q");
	ASSERT_TRUE(ad4q);
	EXPECT_EQ(ad4q->_type, "axtd");
	EXPECT_EQ(ad4q->_channels, 4);

	const auto ur4s = device_class_database::lookup_model_by_name("UR4S");
	ASSERT_TRUE(ur4s);
	EXPECT_EQ(ur4s->_type, "uhfr");
	EXPECT_EQ(ur4s->_channels, 1);

	EXPECT_FALSE(device_class_database::lookup_model_by_name("SLXD4"));
	EXPECT_FALSE(device_class_database::lookup_model_by_name(""));
	EXPECT_FALSE(device_class_database::lookup_model_by_name("ulxd4"));
}

TEST(classify, known_class_id) {
	device_class_database db;
	test::load_sample_database(db);

	const auto f = classify(db, "XY9Z");
	EXPECT_EQ(f._class_id, "XY9Z"s);
	EXPECT_EQ(f._model, "Axient Digital Quad Receiver"s);
	EXPECT_EQ(f._band, "A"s);
	EXPECT_EQ(f._type, "axtd"s);
	EXPECT_EQ(f._channels, 4);
}

TEST(classify, unknown_class_id_keeps_only_the_id) {
	device_class_database db;
	const auto f = classify(db, "ZZZZ");
	EXPECT_EQ(f._class_id, "ZZZZ"s);
	EXPECT_FALSE(f._model);
	EXPECT_FALSE(f._type);
	EXPECT_FALSE(f._channels);
}

} // namespace rfscout
