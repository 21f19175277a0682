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
*	\file		library_logger.cpp
*	\brief		Logger
*
******************************************************************************/

#include "library_logger.hpp"

#include <array>
#include <cstdlib>
#include <utility>
#include <type_traits>

#include <boost/assert.hpp>
#include <boost/config.hpp>
#include <boost/static_assert.hpp>
#include <boost/version.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/fmt/fmt.h>
#include <nlohmann/json.hpp>

#include "version.hpp"

using namespace std::literals;

namespace rfscout {

namespace library_logger {

namespace {

void log_library_versions() {

	auto int_to_triplet = [](int v) -> std::array<int, 3> { return { (v / 10000), (v / 100) % 100, v % 100 }; };
	auto boost_int_to_triplet = [](int v) -> std::array<int, 3> { return { (v / 100000), (v / 100) % 1000, v % 100 }; };

	static constexpr auto rfscout_version = RFSCOUT_VERSION_STRING ""sv;
	static constexpr auto compiler_version = BOOST_COMPILER ""sv;
	static constexpr auto platform_name = BOOST_PLATFORM ""sv;
	static constexpr auto stdlib_version = BOOST_STDLIB ""sv;
	static constexpr auto json_version = { NLOHMANN_JSON_VERSION_MAJOR, NLOHMANN_JSON_VERSION_MINOR, NLOHMANN_JSON_VERSION_PATCH };
	static constexpr auto spdlog_version = { SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH };
	static constexpr auto fmt_version = FMT_VERSION;
	static constexpr auto boost_version = BOOST_VERSION;

	spdlog::info("built on {} {}", __DATE__, __TIME__);
	spdlog::info("compiled with {} on {}", compiler_version, platform_name);
	spdlog::info("stdlib version: {}", stdlib_version);
	spdlog::info("rfscout version: {}", rfscout_version);
	spdlog::info("JSON for Modern C++ version: {}", fmt::join(json_version, "."));
	spdlog::info("spdlog version: {}", fmt::join(spdlog_version, "."));
	spdlog::info("{{fmt}} version: {}", fmt::join(int_to_triplet(fmt_version), "."));
	spdlog::info("Boost version: {}", fmt::join(boost_int_to_triplet(boost_version), "."));

}

// sink singleton
template<typename T, typename... Args>
std::shared_ptr<spdlog::sinks::sink> sink(Args&& ...args) {
	BOOST_STATIC_ASSERT(std::is_base_of<spdlog::sinks::sink, T>::value);
	static auto sink_instance = std::make_shared<T>(std::forward<Args>(args)...);
	return sink_instance;
}

std::shared_ptr<spdlog::sinks::sink> console_sink() {
	using sink_type = spdlog::sinks::stderr_color_sink_mt;
	return sink<sink_type>();
}

std::shared_ptr<spdlog::sinks::sink> file_sink() {
	using sink_type = spdlog::sinks::basic_file_sink_mt;
	const auto home_env = std::getenv("HOME");
	if (home_env == nullptr)
		return nullptr;
	const auto filename = fmt::format(SPDLOG_FILENAME_T("{}/.rfscout/rfscout.log"), home_env);
	static constexpr bool truncate{true};
	return sink<sink_type>(filename, truncate);
}

// the main sink shared by every logger
std::shared_ptr<spdlog::sinks::dist_sink_mt> main_sink() {
	static const auto instance = [] {
		auto dist = std::make_shared<spdlog::sinks::dist_sink_mt>();
		dist->add_sink(console_sink());
		return dist;
	}();
	return instance;
}

} // unnamed namespace

void init(spdlog::level::level_enum default_level) {

	/*
	 * Important notes about logger:
	 * - SPDLOG_LOGGER_TRACE and SPDLOG_LOGGER_DEBUG are not even compiled unless macro SPDLOG_ACTIVE_LEVEL is redefined at compile time
	 * - file sink is added here, and not at first use, so that unit tests never touch the home directory
	 */

	// registration is required for name-based global access and timer-based flush
	spdlog::set_automatic_registration(false);

	// set a default level and then invoke load_env_levels to override the default value using SPDLOG_LEVEL
	spdlog::set_level(default_level);
	spdlog::cfg::load_env_levels();

	try {
		const auto fs = file_sink();
		if (fs != nullptr)
			main_sink()->add_sink(fs);
	}
	catch (const spdlog::spdlog_ex& ex) {
		// log on console only
		spdlog::warn("cannot open log file: {}", ex.what());
	}

	spdlog::flush_on(spdlog::level::warn);

	// create the default logger with these settings
	spdlog::set_default_logger(create_logger("default"s));

	log_library_versions();
}

std::shared_ptr<spdlog::logger> create_logger(const std::string& name) {
	auto logger = std::make_shared<spdlog::logger>(name, main_sink());
	logger->set_level(spdlog::get_level());
	logger->flush_on(spdlog::level::warn);
	return logger;
}

std::shared_ptr<spdlog::logger> create_logger(const std::string& name, const std::optional<spdlog::level::level_enum>& level) {
	const auto logger = create_logger(name);
	if (level) {
		logger->set_level(*level);
		logger->flush_on(*level);
	}
	return logger;
}

} // namespace library_logger

} // namespace rfscout

// custom handler for assertions in debug
#if defined(BOOST_ENABLE_ASSERT_DEBUG_HANDLER) && !defined(NDEBUG)
void boost::assertion_failed(char const* expr, char const* function, char const* file, long line) {
	assertion_failed_msg(expr, "", function, file, line);
}
void boost::assertion_failed_msg(char const* expr, char const* msg, char const* function, char const* file, long line) {
	spdlog::critical("{}: {}\t{}\t{}\t{}", file, line, function, expr, msg);
	std::abort();
}
#endif
