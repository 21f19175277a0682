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
*	\file		payload_parser.cpp
*	\brief		Parsers of announcement and probe payloads
*
******************************************************************************/

#include "payload_parser.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <vector>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

using namespace std::literals;

namespace rfscout {

namespace payload {

namespace {

constexpr auto class_id_marker = "cd:"sv;
constexpr auto class_id_marker_upper = "CD:"sv;

// length of the sequence starting with lead byte, 0 if lead is invalid
std::size_t utf8_sequence_length(std::uint8_t lead) noexcept {
	if (lead < 0x80)
		return 1;
	if (lead >= 0xc2 && lead <= 0xdf)
		return 2;
	if (lead >= 0xe0 && lead <= 0xef)
		return 3;
	if (lead >= 0xf0 && lead <= 0xf4)
		return 4;
	return 0;
}

bool is_continuation(std::uint8_t c) noexcept {
	return (c & 0xc0) == 0x80;
}

/*
 * Allowed range of the byte following lead: excludes overlong forms (E0, F0),
 * surrogates (ED) and code points beyond U+10FFFF (F4).
 */
bool is_valid_second_byte(std::uint8_t lead, std::uint8_t c) noexcept {
	switch (lead) {
	case 0xe0:
		return c >= 0xa0 && c <= 0xbf;
	case 0xed:
		return c >= 0x80 && c <= 0x9f;
	case 0xf0:
		return c >= 0x90 && c <= 0xbf;
	case 0xf4:
		return c >= 0x80 && c <= 0x8f;
	default:
		return is_continuation(c);
	}
}

// true if raw[pos, pos + len) is a well-formed sequence
bool is_valid_sequence(std::string_view raw, std::size_t pos, std::size_t len) noexcept {
	if (pos + len > raw.size())
		return false;
	const auto lead = static_cast<std::uint8_t>(raw[pos]);
	if (!is_valid_second_byte(lead, static_cast<std::uint8_t>(raw[pos + 1])))
		return false;
	for (auto j = pos + 2; j < pos + len; ++j)
		if (!is_continuation(static_cast<std::uint8_t>(raw[j])))
			return false;
	return true;
}

std::vector<std::string> split_tokens(std::string_view line) {
	std::vector<std::string> tokens;
	const std::string s(line);
	boost::split(tokens, s, boost::is_any_of(" \t\r\n\f\v"), boost::token_compress_on);
	tokens.erase(std::remove(tokens.begin(), tokens.end(), std::string{}), tokens.end());
	return tokens;
}

} // unnamed namespace

std::string decode_text(std::string_view raw) {
	std::string res;
	res.reserve(raw.size());
	for (std::size_t i = 0; i < raw.size();) {
		const auto lead = static_cast<std::uint8_t>(raw[i]);
		const auto len = utf8_sequence_length(lead);
		if (len == 0) {
			++i;
			continue;
		}
		if (len == 1) {
			if (lead != 0)
				res.push_back(raw[i]);
			++i;
			continue;
		}
		// invalid lead is skipped alone, continuation bytes are then skipped as invalid leads
		if (!is_valid_sequence(raw, i, len)) {
			++i;
			continue;
		}
		res.append(raw.substr(i, len));
		i += len;
	}
	return res;
}

std::string find_class_id(std::string_view text) {
	std::vector<std::string> segments;
	const std::string s(text);
	boost::split(segments, s, boost::is_any_of(","));
	std::string class_id;
	for (auto& segment : segments) {
		boost::trim_if(segment, boost::is_any_of("()"));
		const auto pos = segment.rfind(class_id_marker);
		if (pos == std::string::npos)
			continue;
		class_id = segment.substr(pos + class_id_marker.size());
		boost::trim_if(class_id, boost::is_any_of(" \t\r\n()"));
	}
	return class_id;
}

std::string match_known_class_id(std::string_view text, const std::function<bool(const std::string&)>& is_known) {
	for (auto& token : split_tokens(text)) {
		boost::trim_if(token, boost::is_any_of(" <>\"\r\n\t;,"));
		boost::to_upper(token);
		if (boost::starts_with(token, class_id_marker_upper))
			token.erase(0, class_id_marker_upper.size());
		if (!token.empty() && is_known(token))
			return token;
	}
	return std::string{};
}

std::optional<std::string> extract_model_hint(std::string_view text) {

	static constexpr std::array<std::string_view, 3> markers{ "MODEL"sv, "PRODUCT"sv, "DEVICE"sv };
	static constexpr std::array<std::string_view, 5> verbs{ "GET"sv, "SET"sv, "REP"sv, "REPORT"sv, "SAMPLE"sv };

	std::vector<std::string> lines;
	const std::string s(text);
	boost::split(lines, s, boost::is_any_of("\r\n"), boost::token_compress_on);

	for (const auto& line : lines) {
		const auto upper = boost::to_upper_copy(line);
		const auto has_marker = std::any_of(markers.begin(), markers.end(), [&upper](std::string_view m) {
			return upper.find(m) != std::string::npos;
		});
		if (!has_marker)
			continue;
		for (auto& part : split_tokens(line)) {
			boost::trim_if(part, boost::is_any_of("<>\""));
			const auto part_upper = boost::to_upper_copy(part);
			if (std::find(verbs.begin(), verbs.end(), part_upper) != verbs.end())
				continue;
			if (part.size() > 2)
				return part;
		}
	}
	return std::nullopt;
}

} // namespace payload

} // namespace rfscout
