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
*	\file		payload_parser.hpp
*	\brief		Parsers of announcement and probe payloads
*
******************************************************************************/

#ifndef RFSCOUT_INCLUDE_PAYLOAD_PARSER_HPP_
#define RFSCOUT_INCLUDE_PAYLOAD_PARSER_HPP_

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace rfscout {

namespace payload {

/**
 * Best-effort UTF-8 decoding: invalid or truncated sequences, overlong forms, surrogates
 * and code points beyond U+10FFFF are dropped, NUL bytes are removed.
 * The result is always valid UTF-8. Never throws on bad input.
 */
std::string decode_text(std::string_view raw);

/**
 * Find class id in an announcement, looking for "cd:" inside the parenthesized,
 * comma separated segments. If more segments match, the last one wins.
 * @return the class id, empty string if not found
 */
std::string find_class_id(std::string_view text);

/**
 * Scan whitespace separated tokens for a known class id. Tokens are stripped of
 * brackets, quotes and punctuation, converted to upper case and an optional "CD:"
 * prefix is removed before the check.
 * @param is_known	predicate telling if a candidate is a known class id
 * @return the first known class id, empty string if not found
 */
std::string match_known_class_id(std::string_view text, const std::function<bool(const std::string&)>& is_known);

/**
 * Heuristic model name extraction from a free-form reply: first line mentioning
 * "model", "product" or "device", first token longer than two characters that is
 * not a protocol verb.
 */
std::optional<std::string> extract_model_hint(std::string_view text);

} // namespace payload

} // namespace rfscout

#endif /* RFSCOUT_INCLUDE_PAYLOAD_PARSER_HPP_ */
