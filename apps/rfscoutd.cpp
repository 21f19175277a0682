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
*	\file		rfscoutd.cpp
*	\brief		Discovery daemon
*
******************************************************************************/

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "discovery_engine.hpp"
#include "library_logger.hpp"
#include "periodic_task.hpp"
#include "settings.hpp"
#include "version.hpp"

using namespace std::literals;

namespace po = boost::program_options;

namespace {

/**
 * Command line values take precedence over the configuration file
 */
struct overriding_settings_provider final : public rfscout::settings_provider {

	overriding_settings_provider(std::unique_ptr<rfscout::settings_provider> base, nlohmann::json overrides)
	: _base(std::move(base))
	, _overrides(std::move(overrides)) {}

	nlohmann::json get_discovery_settings() const override {
		auto raw = _base->get_discovery_settings();
		if (!raw.is_object())
			raw = nlohmann::json::object();
		raw.merge_patch(_overrides);
		return raw;
	}

private:
	const std::unique_ptr<rfscout::settings_provider> _base;
	const nlohmann::json _overrides;
};

std::string default_dcid_path(const std::optional<std::string>& config_path) {
	if (config_path) {
		const auto pos = config_path->find_last_of('/');
		if (pos != std::string::npos)
			return config_path->substr(0, pos + 1) + "dcid.json";
	}
	return "dcid.json"s;
}

void print_json(const nlohmann::json& j) {
	std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

} // unnamed namespace

int main(int argc, char* argv[]) try {

	po::options_description desc("rfscoutd " RFSCOUT_VERSION_STRING " - wireless receiver discovery\nOptions");
	desc.add_options()
		("help,h", "print this help")
		("config,c", po::value<std::string>(), "JSON configuration file, discovery settings are read from its \"discovery\" object")
		("dcid", po::value<std::string>(), "device class database in JSON format (default: dcid.json next to the configuration file)")
		("subnet,s", po::value<std::vector<std::string>>()->composing(), "subnet to scan, in CIDR notation (repeatable)")
		("no-auto", po::bool_switch(), "do not scan the subnet of the outbound interface")
		("interval", po::value<int>(), "active scan interval in seconds")
		("timeout", po::value<int>(), "probe timeout in milliseconds")
		("once", po::bool_switch(), "run a single active scan, print the result and exit")
		("dump-interval", po::value<int>()->default_value(0), "print the discovered devices every N seconds (0 to disable)");

	po::variables_map vm;
	po::store(po::parse_command_line(argc, argv, desc), vm);
	po::notify(vm);

	if (vm.count("help")) {
		std::cout << desc << std::endl;
		return EXIT_SUCCESS;
	}

	rfscout::library_logger::init();

	std::optional<std::string> config_path;
	if (vm.count("config"))
		config_path = vm["config"].as<std::string>();

	const auto dcid_path = vm.count("dcid") ? vm["dcid"].as<std::string>() : default_dcid_path(config_path);

	std::unique_ptr<rfscout::settings_provider> base;
	if (config_path)
		base = std::make_unique<rfscout::json_file_settings_provider>(*config_path);
	else
		base = std::make_unique<rfscout::static_settings_provider>();

	auto overrides = nlohmann::json::object();
	if (vm.count("subnet"))
		overrides[rfscout::discovery_settings::key_subnets()] = vm["subnet"].as<std::vector<std::string>>();
	if (vm["no-auto"].as<bool>())
		overrides[rfscout::discovery_settings::key_auto()] = false;
	if (vm.count("interval"))
		overrides[rfscout::discovery_settings::key_scan_interval()] = vm["interval"].as<int>();
	if (vm.count("timeout"))
		overrides[rfscout::discovery_settings::key_timeout_ms()] = vm["timeout"].as<int>();

	const overriding_settings_provider provider(std::move(base), std::move(overrides));

	rfscout::discovery_engine engine(provider, dcid_path);

	spdlog::info("discovery settings: {}", nlohmann::json(engine.scheduler().current_settings()).dump());
	spdlog::info("{}", engine.dcid_status().dump());

	if (vm["once"].as<bool>()) {
		engine.scan_once();
		print_json(engine.discovered());
		return EXIT_SUCCESS;
	}

	boost::asio::io_context io_context;

	const auto dump_interval = std::chrono::seconds{vm["dump-interval"].as<int>()};

	rfscout::periodic_task dump("dump"s, io_context, dump_interval, [&engine] {
		print_json(engine.discovered());
	});

	boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
	signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
		if (ec)
			return;
		spdlog::info("signal {} received, stopping", signal_number);
		dump.stop();
		engine.stop();
	});

	engine.start();

	if (dump_interval > std::chrono::seconds::zero())
		dump.start();

	io_context.run();

	return EXIT_SUCCESS;
}
catch (const po::error& ex) {
	std::cerr << ex.what() << std::endl;
	return EXIT_FAILURE;
}
catch (const std::exception& ex) {
	spdlog::critical("fatal error: {}", ex.what());
	return EXIT_FAILURE;
}
