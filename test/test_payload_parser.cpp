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
*	\file		test_payload_parser.cpp
*	\brief		Tests of payload parsers
*
******************************************************************************/

#include <set>
#include <string>

#include <gtest/gtest.h>

#include "payload_parser.hpp"

using namespace std::literals;

namespace rfscout {

TEST(decode_text, drops_invalid_bytes_and_nul) {
	EXPECT_EQ(payload::decode_text("abc\0def"sv), "abcdef");
	EXPECT_EQ(payload::decode_text("a\xff" "b"sv), "ab");
	EXPECT_EQ(payload::decode_text("caf\xc3\xa9"sv), "caf\xc3\xa9");
	EXPECT_EQ(payload::decode_text("x\xe2\x82"sv), "x");
	EXPECT_EQ(payload::decode_text(""sv), "");
}

TEST(decode_text, rejects_non_scalar_sequences) {
	// surrogate half
	EXPECT_EQ(payload::decode_text("(svc,cd:\xed\xa0\x80)"sv), "(svc,cd:)");
	// overlong encodings
	EXPECT_EQ(payload::decode_text("\xe0\x80\xaf"sv), "");
	EXPECT_EQ(payload::decode_text("\xc0\xaf"sv), "");
	EXPECT_EQ(payload::decode_text("\xf0\x80\x80\xaf"sv), "");
	// beyond U+10FFFF
	EXPECT_EQ(payload::decode_text("\xf4\x90\x80\x80"sv), "");
	// boundaries that are valid
	EXPECT_EQ(payload::decode_text("\xed\x9f\xbf"sv), "\xed\x9f\xbf");
	EXPECT_EQ(payload::decode_text("\xf4\x8f\xbf\xbf"sv), "\xf4\x8f\xbf\xbf");
	EXPECT_EQ(payload::decode_text("\xe0\xa0\x80"sv), "\xe0\xa0\x80");
}

TEST(decode_text, text_after_truncated_sequence_is_kept) {
	EXPECT_EQ(payload::decode_text("a\xe2" "b"sv), "ab");
	EXPECT_EQ(payload::decode_text("\xe2\x82(cd:AB12)"sv), "(cd:AB12)");
}

TEST(find_class_id, announcement_segments) {
	EXPECT_EQ(payload::find_class_id("(service:wireless-receiver,cd:AB12,sn:1234)"), "AB12");
	EXPECT_EQ(payload::find_class_id("(x=1),(cd:AB12)"), "AB12");
	EXPECT_EQ(payload::find_class_id("cd:FIRST,cd:LAST"), "LAST");
	EXPECT_EQ(payload::find_class_id("no class id here"), "");
	EXPECT_EQ(payload::find_class_id(""), "");
}

TEST(match_known_class_id, token_scan) {
	const std::set<std::string> known{ "AB12", "QX01" };
	const auto is_known = [&known](const std::string& c) { return known.count(c) != 0; };

	EXPECT_EQ(payload::match_known_class_id("< REP 1 DEVICE_ID \"ab12\" >", is_known), "AB12");
	EXPECT_EQ(payload::match_known_class_id("hello cd:qx01;", is_known), "QX01");
	EXPECT_EQ(payload::match_known_class_id("< REP 1 DEVICE_ID 'ZZZZ' >", is_known), "");
	EXPECT_EQ(payload::match_known_class_id("", is_known), "");
}

TEST(extract_model_hint, first_line_with_marker) {
	EXPECT_EQ(payload::extract_model_hint("< REP 1 MODEL {ULXD4} >"), "MODEL"s);
	EXPECT_EQ(payload::extract_model_hint("< REP 1 ALL >\r\n< REP DEVICE ULXD4Q >"), "DEVICE"s);
	EXPECT_EQ(payload::extract_model_hint("< REP xx >\n  product is SLXD4"), "product"s);
	EXPECT_FALSE(payload::extract_model_hint("< REP 1 ALL >"));
	EXPECT_FALSE(payload::extract_model_hint(""));
}

TEST(extract_model_hint, verbs_and_short_tokens_are_skipped) {
	EXPECT_EQ(payload::extract_model_hint("<REPORT> 12 \"AD4D\" model"), "AD4D"s);
	EXPECT_EQ(payload::extract_model_hint("GET ab model"), "model"s);
}

} // namespace rfscout
