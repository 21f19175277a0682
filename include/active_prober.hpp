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
*	\file		active_prober.hpp
*	\brief		TCP sweep of receiver control ports
*
******************************************************************************/

#ifndef RFSCOUT_INCLUDE_ACTIVE_PROBER_HPP_
#define RFSCOUT_INCLUDE_ACTIVE_PROBER_HPP_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/network_v4.hpp>
#include <boost/core/noncopyable.hpp>
#include <spdlog/spdlog.h>

#include "device_class_database.hpp"
#include "discovery_registry.hpp"
#include "lib_definitions.hpp"
#include "settings.hpp"

namespace rfscout {

struct probe_result {
	boost::asio::ip::address_v4 _address;
	device_fields _fields;
	std::string _reply;
	std::chrono::milliseconds _rtt;
};

/**
 * Registry fields that can be inferred from the reply to the inquiry commands:
 * class id (classified with the database) or, as fallback, a model name hint.
 */
device_fields parse_probe_reply(const device_class_database& db, std::string_view reply);

struct active_prober : private boost::noncopyable {

	using interface_address_function = std::function<std::optional<boost::asio::ip::address_v4>()>;

	active_prober(const device_class_database& db, discovery_registry& registry);

	/**
	 * @param port					TCP port to probe
	 * @param max_workers			maximum number of concurrent probes
	 * @param interface_address		source of the local address used for automatic subnet detection
	 */
	active_prober(const device_class_database& db, discovery_registry& registry, std::uint16_t port, std::size_t max_workers, interface_address_function interface_address);

	/**
	 * Configured subnets plus, if enabled, the /24 of the outbound interface. Invalid
	 * or too broad subnets are dropped with a warning. Duplicates are removed.
	 */
	std::vector<boost::asio::ip::network_v4> candidate_subnets(const discovery_settings& config) const;

	/**
	 * Probe all the hosts of all the candidate subnets.
	 * @return number of devices that answered
	 * @throw ex::stop if stop() is called during the scan
	 */
	std::size_t scan(const discovery_settings& config);

	/**
	 * Probe the hosts of a subnet using a bounded worker pool. Answering hosts are added to the registry.
	 * @return number of devices that answered
	 * @throw ex::stop if stop() is called during the scan
	 */
	std::size_t probe_network(const boost::asio::ip::network_v4& network, std::chrono::milliseconds timeout);

	/**
	 * Connect to a single host and send the inquiry commands.
	 * @return empty if the host did not answer (timeout, refused, error)
	 */
	std::optional<probe_result> probe_host(const boost::asio::ip::address_v4& address, std::chrono::milliseconds timeout);

	/**
	 * Abandon pending probes and close in-flight sockets. Thread safe.
	 */
	void stop() noexcept;

	/**
	 * Allow scans again after stop()
	 */
	void reset() noexcept;

	bool is_stopping() const noexcept;

	/**
	 * Hosts of a network: the single address of a /32, both addresses of a /31,
	 * network and broadcast addresses excluded otherwise. At most max_hosts are returned.
	 */
	static std::vector<boost::asio::ip::address_v4> hosts(const boost::asio::ip::network_v4& network, std::size_t max_hosts = limits::max_hosts_per_subnet);

	/**
	 * Local address used to reach the outside world, found without sending any packet.
	 */
	static std::optional<boost::asio::ip::address_v4> default_interface_address();

private:

	void register_context(boost::asio::io_context& ctx);
	void unregister_context(boost::asio::io_context& ctx) noexcept;

	std::shared_ptr<spdlog::logger> _logger;
	const device_class_database& _db;
	discovery_registry& _registry;
	const std::uint16_t _port;
	const std::size_t _max_workers;
	const interface_address_function _interface_address;
	std::atomic<bool> _stopping;
	std::mutex _mtx_in_flight;
	std::set<boost::asio::io_context*> _in_flight;

};

} // namespace rfscout

#endif /* RFSCOUT_INCLUDE_ACTIVE_PROBER_HPP_ */
