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
*	\file		device_class_database.hpp
*	\brief		Device class id database
*
******************************************************************************/

#ifndef RFSCOUT_INCLUDE_DEVICE_CLASS_DATABASE_HPP_
#define RFSCOUT_INCLUDE_DEVICE_CLASS_DATABASE_HPP_

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include <boost/core/noncopyable.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "json/json_utilities.hpp"

namespace rfscout {

struct device_class_entry {

	std::string _class_id;
	std::string _model_key;
	std::string _model_name;
	std::string _band;

	/**
	 * Name to be shown on the dashboard: model name, or model key if the former is empty
	 */
	const std::string& display_name() const noexcept {
		return _model_name.empty() ? _model_key : _model_name;
	}

	static constexpr auto& key_model() noexcept { return "model"; }
	static constexpr auto& key_model_name() noexcept { return "model_name"; }
	static constexpr auto& key_band() noexcept { return "band"; }

	friend bool operator==(const device_class_entry& lhs, const device_class_entry& rhs) noexcept {
		return lhs._class_id == rhs._class_id
			&& lhs._model_key == rhs._model_key
			&& lhs._model_name == rhs._model_name
			&& lhs._band == rhs._band;
	}

	friend bool operator!=(const device_class_entry& lhs, const device_class_entry& rhs) noexcept {
		return !(lhs == rhs);
	}

	// class id is the key of the enclosing object, not serialized here
	friend void to_json(nlohmann::json& j, const device_class_entry& e) {
		json::set(j, key_model(), e._model_key);
		json::set(j, key_model_name(), e._model_name);
		json::set(j, key_band(), e._band);
	}

	friend void from_json(const nlohmann::json& j, device_class_entry& e) {
		json::get_if_not_null(j, key_model(), e._model_key);
		json::get_if_not_null(j, key_model_name(), e._model_name);
		json::get_if_not_null(j, key_band(), e._band);
	}

};

/**
 * Classification of a model key: device type and number of channels
 */
struct model_info {
	std::string _type;
	int _channels;
};

enum struct database_state {
	LOADED,
	NOT_GENERATED,
	NOT_FOUND,
};

struct database_status {

	database_state _state;
	std::optional<std::string> _source;
	std::string _message;

	bool loaded() const noexcept { return _state == database_state::LOADED; }

	static constexpr auto& key_loaded() noexcept { return "loaded"; }
	static constexpr auto& key_source() noexcept { return "source"; }
	static constexpr auto& key_message() noexcept { return "message"; }

	friend void to_json(nlohmann::json& j, const database_status& s) {
		json::set(j, key_loaded(), s.loaded());
		json::set(j, key_source(), s._source);
		json::set(j, key_message(), s._message);
	}

};

struct device_class_database : private boost::noncopyable {

	using map_type = std::map<std::string, device_class_entry>;

	device_class_database();

	/**
	 * Parse a vendor DCIDMap.xml and merge its content into the live mapping.
	 * Malformed records are skipped.
	 * @param path	XML file
	 * @return number of class ids read from the file
	 * @throw ex::file_error if the file cannot be opened or parsed
	 */
	std::size_t load(const std::string& path);

	/**
	 * Write the live mapping as flat JSON object (class id -> {model, model_name, band})
	 * @throw ex::file_error on write failure
	 */
	void save_to_file(const std::string& path) const;

	/**
	 * Replace the live mapping with the content of a file written by save_to_file().
	 * On failure the previous mapping is left untouched.
	 * @throw ex::file_error on read or parse failure
	 */
	void restore_from_file(const std::string& path);

	/**
	 * Offline conversion from vendor XML to JSON
	 */
	std::size_t convert(const std::string& xml_path, const std::string& json_path);

	std::optional<device_class_entry> lookup_by_class_id(const std::string& class_id) const;

	bool contains(const std::string& class_id) const;

	std::size_t size() const;

	map_type entries() const;

	void clear();

	/**
	 * Recompute status() after a (tentative) load.
	 * @param source	path of the file the mapping has been loaded from, if any
	 */
	void refresh_status(const std::optional<std::string>& source);

	database_status status() const;

	/**
	 * Look up a model key in the static device type table.
	 * Linear scan, the table is small.
	 */
	static std::optional<model_info> lookup_model_by_name(const std::string& model_key);

	/**
	 * Path of the vendor XML shipped with the vendor update utility, if installed on this host
	 */
	static std::optional<std::string> default_vendor_xml();

private:
	std::shared_ptr<spdlog::logger> _logger;
	mutable std::mutex _mtx;
	map_type _map;
	database_status _status;
};

} // namespace rfscout

#endif /* RFSCOUT_INCLUDE_DEVICE_CLASS_DATABASE_HPP_ */
