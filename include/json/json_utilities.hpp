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
*	\file		json_utilities.hpp
*	\brief		JSON utilities
*
******************************************************************************/

#ifndef RFSCOUT_INCLUDE_JSON_JSON_UTILITIES_HPP_
#define RFSCOUT_INCLUDE_JSON_JSON_UTILITIES_HPP_

#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

// partial specialization for std::optional
namespace nlohmann {

template <typename T>
struct adl_serializer<std::optional<T>> {
	static void to_json(json& j, const std::optional<T>& opt) {
		if (!opt)
			j = nullptr;
		else
			j = *opt;
	}
	static void from_json(const json& j, std::optional<T>& opt) {
		if (j.is_null())
			opt = std::nullopt;
		else
			opt = j.get<T>();
	}
};

} // namespace nlohmann

namespace rfscout {

namespace json {

template <typename BasicJsonType, typename T, typename TKey>
void get_if_not_null(const BasicJsonType& j, TKey&& key, T& value) {
	const auto it = j.find(std::forward<TKey>(key));
	if (it != j.end() && !it->is_null())
		it->get_to(value);
}

template <typename BasicJsonType, typename T, typename TKey>
void set(BasicJsonType& j, TKey&& key, T&& value) {
	j[std::forward<TKey>(key)] = std::forward<T>(value);
}

/**
 * Convert a type (enum, in particular), to string version, using to_json
 * @tparam T	input type
 * @param v		value
 * @return		a string that can be converted back to enum from_json
 */
template <typename T, typename String = std::string>
String to_json_string(T&& v) {
	return nlohmann::json(std::forward<T>(v)).template get<String>();
}

} // namespace json

} // namespace rfscout

#endif /* RFSCOUT_INCLUDE_JSON_JSON_UTILITIES_HPP_ */
