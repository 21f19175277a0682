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
*	\file		test_active_prober.cpp
*	\brief		Tests of active_prober
*
******************************************************************************/

#include <chrono>
#include <future>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <gtest/gtest.h>

#include "active_prober.hpp"
#include "device_class_database.hpp"
#include "discovery_registry.hpp"
#include "lib_error.hpp"
#include "settings.hpp"
#include "test_utilities.hpp"

using namespace std::literals;

namespace rfscout {

namespace ip = boost::asio::ip;

struct active_prober_test : public ::testing::Test {

	void SetUp() override {
		test::load_sample_database(_db);
	}

	active_prober make_prober(std::uint16_t port, std::optional<ip::address_v4> interface_address = std::nullopt) {
		return active_prober(_db, _registry, port, 4, [interface_address] { return interface_address; });
	}

	device_class_database _db;
	discovery_registry _registry;
};

TEST_F(active_prober_test, hosts_of_a_network) {
	const auto h30 = active_prober::hosts(ip::make_network_v4("10.0.0.0/30"));
	ASSERT_EQ(h30.size(), 2U);
	EXPECT_EQ(h30[0].to_string(), "10.0.0.1");
	EXPECT_EQ(h30[1].to_string(), "10.0.0.2");

	const auto h31 = active_prober::hosts(ip::make_network_v4("10.0.0.4/31"));
	ASSERT_EQ(h31.size(), 2U);
	EXPECT_EQ(h31[0].to_string(), "10.0.0.4");
	EXPECT_EQ(h31[1].to_string(), "10.0.0.5");

	const auto h32 = active_prober::hosts(ip::make_network_v4("10.0.0.9/32"));
	ASSERT_EQ(h32.size(), 1U);
	EXPECT_EQ(h32[0].to_string(), "10.0.0.9");

	EXPECT_EQ(active_prober::hosts(ip::make_network_v4("10.0.0.0/22"), 10).size(), 10U);
	EXPECT_EQ(active_prober::hosts(ip::make_network_v4("10.1.0.0/16")).size(), limits::max_hosts_per_subnet);
	EXPECT_EQ(active_prober::hosts(ip::make_network_v4("10.0.0.0/24")).size(), 254U);
}

TEST_F(active_prober_test, candidate_subnets) {
	const auto prober = make_prober(protocol::probe_port, ip::make_address_v4("192.168.5.77"));

	discovery_settings config;
	config._subnets = { "10.0.0.0/24", "192.168.5.0/24", "not-a-subnet", "10.0.0.0/8" };

	auto networks = prober.candidate_subnets(config);
	ASSERT_EQ(networks.size(), 2U);
	EXPECT_EQ(networks[0].to_string(), "10.0.0.0/24");
	EXPECT_EQ(networks[1].to_string(), "192.168.5.0/24");

	config._subnets.clear();
	networks = prober.candidate_subnets(config);
	ASSERT_EQ(networks.size(), 1U);
	EXPECT_EQ(networks[0].to_string(), "192.168.5.0/24");

	config._auto = false;
	EXPECT_TRUE(prober.candidate_subnets(config).empty());
}

TEST_F(active_prober_test, no_automatic_subnet_without_interface) {
	const auto prober = make_prober(protocol::probe_port);
	const discovery_settings config;
	EXPECT_TRUE(prober.candidate_subnets(config).empty());
}

TEST_F(active_prober_test, parse_probe_reply) {
	auto f = parse_probe_reply(_db, "(cd:AB12)");
	EXPECT_EQ(f._class_id, "AB12"s);
	EXPECT_EQ(f._type, "ulxd"s);

	f = parse_probe_reply(_db, "< REP 1 DEVICE_ID cd:XY9Z >\r\n");
	EXPECT_EQ(f._class_id, "XY9Z"s);
	EXPECT_EQ(f._channels, 4);

	f = parse_probe_reply(_db, "< REP 1 DEVICE_ID \"qx01\" >");
	EXPECT_EQ(f._class_id, "QX01"s);
	EXPECT_EQ(f._model, "QLXD4"s);

	f = parse_probe_reply(_db, "<REP> 1 SLXD4 model\r\n");
	EXPECT_FALSE(f._class_id);
	EXPECT_EQ(f._model, "SLXD4"s);

	f = parse_probe_reply(_db, "");
	EXPECT_FALSE(f._class_id);
	EXPECT_FALSE(f._model);
}

TEST_F(active_prober_test, probe_host_with_class_id) {
	test::fake_receiver receiver("< REP 1 DEVICE_ID cd:AB12 >\r\n");
	auto prober = make_prober(receiver.port());

	const auto result = prober.probe_host(ip::address_v4::loopback(), 500ms);
	ASSERT_TRUE(result);
	EXPECT_EQ(result->_address, ip::address_v4::loopback());
	EXPECT_EQ(result->_fields._source, discovery_source::ACTIVE);
	EXPECT_TRUE(result->_fields._reachable);
	EXPECT_EQ(result->_fields._class_id, "AB12"s);
	EXPECT_EQ(result->_fields._type, "ulxd"s);
	EXPECT_EQ(result->_reply, "< REP 1 DEVICE_ID cd:AB12 >");
}

TEST_F(active_prober_test, probe_host_with_model_hint) {
	test::fake_receiver receiver("<REP> 1 SLXD4 model\r\n");
	auto prober = make_prober(receiver.port());

	const auto result = prober.probe_host(ip::address_v4::loopback(), 500ms);
	ASSERT_TRUE(result);
	EXPECT_FALSE(result->_fields._class_id);
	EXPECT_EQ(result->_fields._model, "SLXD4"s);
	EXPECT_FALSE(result->_fields._type);
}

TEST_F(active_prober_test, silent_host_is_reported_without_data) {
	test::fake_receiver receiver(""s);
	auto prober = make_prober(receiver.port());

	const auto result = prober.probe_host(ip::address_v4::loopback(), 100ms);
	ASSERT_TRUE(result);
	EXPECT_TRUE(result->_reply.empty());
	EXPECT_FALSE(result->_fields._model);
	EXPECT_FALSE(result->_fields._class_id);
	EXPECT_EQ(result->_fields._source, discovery_source::ACTIVE);
}

TEST_F(active_prober_test, refused_connection) {
	auto prober = make_prober(test::unused_port());
	EXPECT_FALSE(prober.probe_host(ip::address_v4::loopback(), 300ms));
}

TEST_F(active_prober_test, stop_aborts_in_flight_probe) {
	test::fake_receiver receiver(""s);
	auto prober = make_prober(receiver.port());

	auto f = std::async(std::launch::async, [&prober] {
		return prober.probe_host(ip::address_v4::loopback(), 5s);
	});

	std::this_thread::sleep_for(200ms);
	const auto start = std::chrono::steady_clock::now();
	prober.stop();

	ASSERT_EQ(f.wait_for(3s), std::future_status::ready);
	EXPECT_FALSE(f.get());
	EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
}

TEST_F(active_prober_test, probe_after_stop_returns_without_waiting) {
	test::fake_receiver receiver(""s);
	auto prober = make_prober(receiver.port());

	prober.stop();

	const auto start = std::chrono::steady_clock::now();
	EXPECT_FALSE(prober.probe_host(ip::address_v4::loopback(), 5s));
	EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST_F(active_prober_test, scan_updates_registry) {
	test::fake_receiver receiver("(cd:XY9Z)\r\n");
	auto prober = make_prober(receiver.port());

	discovery_settings config;
	config._auto = false;
	config._subnets = { "127.0.0.1/32" };
	config._timeout_ms = 500;

	EXPECT_EQ(prober.scan(config), 1U);

	const auto d = _registry.find("127.0.0.1");
	ASSERT_TRUE(d);
	EXPECT_EQ(d->_source, discovery_source::ACTIVE);
	EXPECT_EQ(d->_type, "axtd");
	EXPECT_EQ(d->_channels, 4);
	EXPECT_EQ(d->_model, "Axient Digital Quad Receiver"s);
}

TEST_F(active_prober_test, scan_without_subnets_does_nothing) {
	auto prober = make_prober(test::unused_port());
	discovery_settings config;
	config._auto = false;
	EXPECT_EQ(prober.scan(config), 0U);
	EXPECT_EQ(_registry.size(), 0U);
}

TEST_F(active_prober_test, scan_of_silent_network_finds_nothing) {
	auto prober = make_prober(test::unused_port());
	discovery_settings config;
	config._auto = false;
	config._subnets = { "127.0.0.0/30" };
	config._timeout_ms = 100;
	EXPECT_EQ(prober.scan(config), 0U);
	EXPECT_EQ(_registry.size(), 0U);
}

TEST_F(active_prober_test, scan_after_stop_throws) {
	auto prober = make_prober(test::unused_port());
	discovery_settings config;
	config._auto = false;
	config._subnets = { "127.0.0.1/32" };

	prober.stop();
	EXPECT_TRUE(prober.is_stopping());
	EXPECT_THROW(prober.scan(config), ex::stop);

	prober.reset();
	EXPECT_FALSE(prober.is_stopping());
	EXPECT_NO_THROW(prober.scan(config));
}

} // namespace rfscout
