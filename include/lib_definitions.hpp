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
*	\file		lib_definitions.hpp
*	\brief		Protocol constants and limits
*
******************************************************************************/

#ifndef RFSCOUT_INCLUDE_LIB_DEFINITIONS_HPP_
#define RFSCOUT_INCLUDE_LIB_DEFINITIONS_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace rfscout {

namespace protocol {

// vendor SLP-like announcements
static constexpr auto& multicast_group() noexcept { return "239.255.254.253"; }
static constexpr std::uint16_t multicast_port{8427};

// receiver control port
static constexpr std::uint16_t probe_port{2202};

static constexpr std::size_t max_datagram_size{4096};
static constexpr std::size_t max_reply_size{4096};

// address used only to find the outbound interface, nothing is sent
static constexpr auto& route_probe_address() noexcept { return "8.8.8.8"; }
static constexpr std::uint16_t route_probe_port{80};

} // namespace protocol

namespace limits {

static constexpr std::size_t max_probe_workers{24};
static constexpr std::size_t max_hosts_per_subnet{1024};
static constexpr unsigned int min_prefix_length{16};
static constexpr unsigned int auto_prefix_length{24};

static constexpr int min_scan_interval_s{15};
static constexpr int max_scan_interval_s{900};
static constexpr int min_timeout_ms{100};
static constexpr int max_timeout_ms{5000};

} // namespace limits

namespace defaults {

static constexpr bool auto_detect{true};
static constexpr int scan_interval_s{60};
static constexpr int timeout_ms{750};

} // namespace defaults

namespace timing {

using namespace std::chrono_literals;

static constexpr std::chrono::seconds listen_timeout{1s};
static constexpr std::chrono::seconds socket_error_pause{1s};
static constexpr std::chrono::seconds restart_delay{5s};
static constexpr std::chrono::seconds active_scan_ttl{180s};
static constexpr unsigned int ttl_scan_multiplier{3};

} // namespace timing

} // namespace rfscout

#endif /* RFSCOUT_INCLUDE_LIB_DEFINITIONS_HPP_ */
