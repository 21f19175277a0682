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
*	\file		device_class_database.cpp
*	\brief		Device class id database
*
******************************************************************************/

#include "device_class_database.hpp"

#include <array>
#include <fstream>
#include <utility>

#include <boost/predef/os.h>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <spdlog/fmt/fmt.h>

#include "lib_error.hpp"
#include "library_logger.hpp"

using namespace std::literals;

namespace rfscout {

namespace {

struct model_table_entry {
	const char* _type;
	const char* _model_key;
	int _channels;
};

// device type -> models, in type order
constexpr std::array<model_table_entry, 10> model_table{{
	{ "uhfr",	"UR4D",		2 },
	{ "uhfr",	"UR4S",		1 },
	{ "qlxd",	"QLXD4",	1 },
	{ "ulxd",	"ULXD4",	1 },
	{ "ulxd",	"ULXD4D",	2 },
	{ "ulxd",	"ULXD4Q",	4 },
	{ "axtd",	"AD4D",		2 },
	{ "axtd",	"AD4Q",		4 },
	{ "axtd",	"AXT400",	2 },
	{ "p10t",	"P10T",		2 },
}};

#if BOOST_OS_MACOS
constexpr auto& vendor_xml_path() noexcept {
	return "/Applications/Shure Update Utility.app/Contents/Resources/DCIDMap.xml";
}

bool is_readable(const std::string& path) {
	std::ifstream f(path);
	return f.good();
}
#endif

} // unnamed namespace

device_class_database::device_class_database()
: _logger{library_logger::create_logger("dcid"s)}
, _mtx{}
, _map{}
, _status{database_state::NOT_FOUND, std::nullopt, "DCID map not loaded. Install Shure Update Utility or provide dcid.json."s} {
}

std::size_t device_class_database::load(const std::string& path) {

	namespace pt = boost::property_tree;

	pt::ptree tree;
	try {
		pt::read_xml(path, tree, pt::xml_parser::trim_whitespace);
	}
	catch (const pt::xml_parser_error& ex) {
		throw ex::file_error(fmt::format("cannot read {}: {}", path, ex.what()));
	}

	map_type parsed;
	std::size_t skipped{};

	// document root is the only child of the tree
	for (const auto& root : tree) {
		for (const auto& node : root.second) {
			if (node.first != "MapEntry")
				continue;
			const auto& entry = node.second;
			const auto key = entry.get_child_optional("Key");
			const auto model_name = entry.get_child_optional("ModelName");
			const auto dcid_list = entry.get_child_optional("DCIDList");
			if (!key || !model_name || !dcid_list) {
				++skipped;
				continue;
			}
			for (const auto& dcid : *dcid_list) {
				if (dcid.first != "DCID")
					continue;
				const auto& class_id = dcid.second.data();
				if (class_id.empty()) {
					++skipped;
					continue;
				}
				device_class_entry e;
				e._class_id = class_id;
				e._model_key = key->data();
				e._model_name = model_name->data();
				e._band = dcid.second.get("<xmlattr>.band"s, std::string{});
				parsed[class_id] = std::move(e);
			}
		}
	}

	if (skipped != 0)
		_logger->warn("skipped {} malformed records in {}", skipped, path);

	const auto n = parsed.size();

	{
		std::lock_guard<std::mutex> lk{_mtx};
		for (auto& p : parsed)
			_map[p.first] = std::move(p.second);
	}

	_logger->info("loaded {} class ids from {}", n, path);

	return n;
}

void device_class_database::save_to_file(const std::string& path) const {

	nlohmann::json j = nlohmann::json::object();
	{
		std::lock_guard<std::mutex> lk{_mtx};
		for (const auto& p : _map)
			j[p.first] = p.second;
	}

	std::ofstream out(path, std::ios::out | std::ios::trunc);
	if (!out)
		throw ex::file_error(fmt::format("cannot open {} for writing", path));

	out << j.dump(2) << '\n';

	if (!out)
		throw ex::file_error(fmt::format("write failed on {}", path));

	SPDLOG_LOGGER_DEBUG(_logger, "saved {} class ids to {}", j.size(), path);
}

void device_class_database::restore_from_file(const std::string& path) {

	std::ifstream in(path);
	if (!in)
		throw ex::file_error(fmt::format("cannot open {}", path));

	nlohmann::json j;
	try {
		in >> j;
	}
	catch (const nlohmann::json::exception& ex) {
		throw ex::file_error(fmt::format("invalid JSON in {}: {}", path, ex.what()));
	}

	if (!j.is_object())
		throw ex::file_error(fmt::format("invalid content in {}: object expected", path));

	map_type restored;
	for (auto it = j.begin(); it != j.end(); ++it) {
		if (!it->is_object()) {
			_logger->warn("skipping invalid record {} in {}", it.key(), path);
			continue;
		}
		device_class_entry e;
		try {
			it->get_to(e);
		}
		catch (const nlohmann::json::exception& ex) {
			_logger->warn("skipping invalid record {} in {}: {}", it.key(), path, ex.what());
			continue;
		}
		e._class_id = it.key();
		restored.emplace(it.key(), std::move(e));
	}

	{
		std::lock_guard<std::mutex> lk{_mtx};
		_map = std::move(restored);
	}

	SPDLOG_LOGGER_DEBUG(_logger, "restored {} class ids from {}", size(), path);
}

std::size_t device_class_database::convert(const std::string& xml_path, const std::string& json_path) {
	const auto n = load(xml_path);
	save_to_file(json_path);
	return n;
}

std::optional<device_class_entry> device_class_database::lookup_by_class_id(const std::string& class_id) const {
	if (class_id.empty())
		return std::nullopt;
	std::lock_guard<std::mutex> lk{_mtx};
	const auto it = _map.find(class_id);
	if (it == _map.end())
		return std::nullopt;
	return it->second;
}

bool device_class_database::contains(const std::string& class_id) const {
	std::lock_guard<std::mutex> lk{_mtx};
	return _map.count(class_id) != 0;
}

std::size_t device_class_database::size() const {
	std::lock_guard<std::mutex> lk{_mtx};
	return _map.size();
}

device_class_database::map_type device_class_database::entries() const {
	std::lock_guard<std::mutex> lk{_mtx};
	return _map;
}

void device_class_database::clear() {
	std::lock_guard<std::mutex> lk{_mtx};
	_map.clear();
}

void device_class_database::refresh_status(const std::optional<std::string>& source) {

	const auto n = size();

	database_status new_status;
	new_status._source = source;

	if (n != 0) {
		new_status._state = database_state::LOADED;
		new_status._message = fmt::format("DCID map loaded with {} entries", n);
		if (source)
			new_status._message += fmt::format(" from {}", *source);
		SPDLOG_LOGGER_DEBUG(_logger, "{}", new_status._message);
	} else {
		const auto vendor_xml = default_vendor_xml();
		if (vendor_xml) {
			new_status._state = database_state::NOT_GENERATED;
			new_status._message = fmt::format("DCID map not generated. Run \"rfscout-dcid --convert -i \\\"{}\\\" -o dcid.json\" to import the Shure Update Utility database.", *vendor_xml);
		} else {
			new_status._state = database_state::NOT_FOUND;
			new_status._message = "DCID map not found. Install Shure Update Utility or provide dcid.json so discovery can classify receivers."s;
		}
		_logger->warn("{}", new_status._message);
	}

	std::lock_guard<std::mutex> lk{_mtx};
	_status = std::move(new_status);
}

database_status device_class_database::status() const {
	std::lock_guard<std::mutex> lk{_mtx};
	return _status;
}

std::optional<model_info> device_class_database::lookup_model_by_name(const std::string& model_key) {
	if (model_key.empty())
		return std::nullopt;
	for (const auto& e : model_table)
		if (model_key == e._model_key)
			return model_info{e._type, e._channels};
	return std::nullopt;
}

std::optional<std::string> device_class_database::default_vendor_xml() {
#if BOOST_OS_MACOS
	if (is_readable(vendor_xml_path()))
		return std::string(vendor_xml_path());
#endif
	return std::nullopt;
}

} // namespace rfscout
