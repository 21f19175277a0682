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
*	\file		rfscout_dcid.cpp
*	\brief		Device class database conversion tool
*
******************************************************************************/

#include <cstdlib>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "device_class_database.hpp"
#include "discovery_engine.hpp"
#include "lib_error.hpp"
#include "library_logger.hpp"
#include "settings.hpp"
#include "version.hpp"

namespace po = boost::program_options;

int main(int argc, char* argv[]) try {

	po::options_description desc("rfscout-dcid " RFSCOUT_VERSION_STRING " - device class database tool\nOptions");
	desc.add_options()
		("help,h", "print this help")
		("input,i", po::value<std::string>(), "DCID input file (DCIDMap.xml)")
		("output,o", po::value<std::string>(), "output file")
		("convert,c", po::bool_switch(), "generate dcid.json from input DCIDMap.xml file")
		("discover,d", po::bool_switch(), "discover devices on the network, using the output file as database");

	po::variables_map vm;
	po::store(po::parse_command_line(argc, argv, desc), vm);
	po::notify(vm);

	if (vm.count("help")) {
		std::cout << desc << std::endl;
		return EXIT_SUCCESS;
	}

	rfscout::library_logger::init(spdlog::level::warn);

	if (vm["convert"].as<bool>()) {

		if (!vm.count("output")) {
			std::cout << "use -o to specify a DCID output file destination" << std::endl;
			return EXIT_FAILURE;
		}

		std::string input;
		if (vm.count("input")) {
			input = vm["input"].as<std::string>();
		} else if (const auto vendor_xml = rfscout::device_class_database::default_vendor_xml()) {
			input = *vendor_xml;
		} else {
			std::cout << "Specify an input DCIDMap.xml file with -i or install Wireless Workbench" << std::endl;
			return EXIT_FAILURE;
		}

		const auto& output = vm["output"].as<std::string>();
		std::cout << "Converting " << input << " to " << output << std::endl;
		rfscout::device_class_database db;
		const auto n = db.convert(input, output);
		std::cout << n << " class ids written" << std::endl;
		return EXIT_SUCCESS;
	}

	if (vm["discover"].as<bool>()) {
		std::cout << "Starting discovery loop (Ctrl+C to exit)" << std::endl;
		const rfscout::static_settings_provider provider;
		const auto dcid_path = vm.count("output") ? vm["output"].as<std::string>() : std::string("dcid.json");
		rfscout::discovery_engine engine(provider, dcid_path);
		engine.run();
		return EXIT_SUCCESS;
	}

	std::cout << desc << std::endl;
	return EXIT_SUCCESS;
}
catch (const po::error& ex) {
	std::cerr << ex.what() << std::endl;
	return EXIT_FAILURE;
}
catch (const rfscout::ex::file_error& ex) {
	std::cerr << ex.what() << std::endl;
	return EXIT_FAILURE;
}
catch (const std::exception& ex) {
	std::cerr << "fatal error: " << ex.what() << std::endl;
	return EXIT_FAILURE;
}
