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
*	\file		passive_listener.hpp
*	\brief		Multicast announcement listener
*
******************************************************************************/

#ifndef RFSCOUT_INCLUDE_PASSIVE_LISTENER_HPP_
#define RFSCOUT_INCLUDE_PASSIVE_LISTENER_HPP_

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/core/noncopyable.hpp>
#include <spdlog/spdlog.h>

#include "device_class_database.hpp"
#include "discovery_registry.hpp"
#include "lib_definitions.hpp"

namespace rfscout {

/**
 * Listener of vendor multicast announcements. Not thread safe, except for interrupt():
 * it is meant to be driven by the scheduler thread.
 */
struct passive_listener : private boost::noncopyable {

	passive_listener(const device_class_database& db, discovery_registry& registry);

	/**
	 * @param group	multicast group to join
	 * @param port	UDP port to bind (0 for an ephemeral port)
	 */
	passive_listener(const device_class_database& db, discovery_registry& registry, boost::asio::ip::address_v4 group, std::uint16_t port);

	~passive_listener();

	/**
	 * Bind the socket on the group address (falling back on the wildcard address) and join the group.
	 * @throw ex::socket_error if the socket cannot be opened, bound or joined to the group
	 */
	void open();

	void close() noexcept;

	bool is_open() const noexcept;

	/**
	 * Wait at most timeout for a datagram, and handle it.
	 * @return true if a datagram has been received
	 * @throw ex::socket_error on socket errors other than timeout
	 */
	bool receive_for(std::chrono::milliseconds timeout);

	/**
	 * Make a pending receive_for() return as soon as possible. If none is pending, the next one
	 * returns without waiting. Thread safe.
	 */
	void interrupt() noexcept;

	/**
	 * Decode an announcement and update the registry.
	 * @return true if the registry has been updated
	 */
	bool handle_datagram(std::string_view raw, const std::string& remote_ip);

	std::uint16_t local_port() const;

private:
	std::shared_ptr<spdlog::logger> _logger;
	const device_class_database& _db;
	discovery_registry& _registry;
	const boost::asio::ip::address_v4 _group;
	const std::uint16_t _port;
	boost::asio::io_context _io_context;
	boost::asio::ip::udp::socket _socket;
	boost::asio::ip::udp::endpoint _remote_ep;
	std::array<char, protocol::max_datagram_size> _buffer;
	std::atomic<bool> _interrupted;
};

} // namespace rfscout

#endif /* RFSCOUT_INCLUDE_PASSIVE_LISTENER_HPP_ */
