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
*	\file		active_prober.cpp
*	\brief		TCP sweep of receiver control ports
*
******************************************************************************/

#include "active_prober.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/core/ignore_unused.hpp>
#include <spdlog/fmt/fmt.h>

#include "classification.hpp"
#include "cpp-utility/run_context.hpp"
#include "cpp-utility/scope_exit.hpp"
#include "lib_error.hpp"
#include "library_logger.hpp"
#include "payload_parser.hpp"

using namespace std::literals;

namespace rfscout {

namespace {

constexpr std::array<std::string_view, 3> inquiry_commands{
	"< GET 1 DEVICE_ID >\r\n"sv,
	"< GET 1 ALL >\r\n"sv,
	"< GET DEVICE_ID >\r\n"sv,
};

} // unnamed namespace

device_fields parse_probe_reply(const device_class_database& db, std::string_view reply) {

	device_fields fields;

	if (reply.empty())
		return fields;

	auto class_id = payload::find_class_id(reply);
	if (class_id.empty() || !db.contains(class_id))
		class_id = payload::match_known_class_id(reply, [&db](const std::string& candidate) {
			return db.contains(candidate);
		});

	if (!class_id.empty())
		return classify(db, class_id);

	fields._model = payload::extract_model_hint(reply);
	return fields;
}

active_prober::active_prober(const device_class_database& db, discovery_registry& registry)
: active_prober(db, registry, protocol::probe_port, limits::max_probe_workers, &active_prober::default_interface_address) {
}

active_prober::active_prober(const device_class_database& db, discovery_registry& registry, std::uint16_t port, std::size_t max_workers, interface_address_function interface_address)
: _logger{library_logger::create_logger("active"s)}
, _db(db)
, _registry(registry)
, _port{port}
, _max_workers{std::clamp<std::size_t>(max_workers, 1, limits::max_probe_workers)}
, _interface_address{std::move(interface_address)}
, _stopping{false}
, _mtx_in_flight{}
, _in_flight{} {
}

std::vector<boost::asio::ip::network_v4> active_prober::candidate_subnets(const discovery_settings& config) const {

	namespace ip = boost::asio::ip;

	std::vector<ip::network_v4> candidates;

	for (const auto& entry : config._subnets) {
		try {
			candidates.emplace_back(settings::parse_subnet(entry));
		}
		catch (const ex::invalid_argument& ex) {
			_logger->warn("skipping discovery subnet {}: {}", entry, ex.what());
		}
	}

	if (config._auto) {
		const auto address = _interface_address ? _interface_address() : std::nullopt;
		if (address)
			candidates.emplace_back(ip::network_v4(*address, limits::auto_prefix_length).canonical());
		else
			SPDLOG_LOGGER_DEBUG(_logger, "unable to derive automatic subnet");
	}

	std::vector<ip::network_v4> res;
	std::set<std::string> seen;
	for (const auto& network : candidates)
		if (seen.insert(network.to_string()).second)
			res.push_back(network);

	return res;
}

std::size_t active_prober::scan(const discovery_settings& config) {

	const auto networks = candidate_subnets(config);

	if (networks.empty()) {
		SPDLOG_LOGGER_DEBUG(_logger, "no discovery subnets configured for active scan");
		return 0;
	}

	std::size_t found{};
	for (const auto& network : networks) {
		if (is_stopping())
			throw ex::stop();
		found += probe_network(network, config.timeout());
	}

	_logger->info("active scan completed: {} devices answered on {} subnets", found, networks.size());

	return found;
}

std::size_t active_prober::probe_network(const boost::asio::ip::network_v4& network, std::chrono::milliseconds timeout) {

	const auto targets = hosts(network);
	if (targets.empty())
		return 0;

	const auto workers = std::min(_max_workers, targets.size());

	SPDLOG_LOGGER_DEBUG(_logger, "active scan on {} with {} hosts (workers={})", network.to_string(), targets.size(), workers);

	std::atomic<std::size_t> found{0};

	boost::asio::thread_pool pool(workers);

	for (const auto& address : targets) {
		if (is_stopping())
			break;
		boost::asio::post(pool, [this, address, timeout, &found] {
			// abandoned after stop
			if (is_stopping())
				return;
			try {
				const auto result = probe_host(address, timeout);
				if (!result)
					return;
				_registry.upsert(result->_address.to_string(), result->_fields);
				++found;
			}
			catch (const std::exception& ex) {
				SPDLOG_LOGGER_DEBUG(_logger, "probe error for {}: {}", address.to_string(), ex.what());
				boost::ignore_unused(ex);
			}
		});
	}

	pool.join();

	if (is_stopping()) {
		_logger->debug("active scan halted while shutting down");
		throw ex::stop();
	}

	return found;
}

std::optional<probe_result> active_prober::probe_host(const boost::asio::ip::address_v4& address, std::chrono::milliseconds timeout) {

	namespace ip = boost::asio::ip;

	const auto start = std::chrono::steady_clock::now();

	boost::asio::io_context ctx;
	ip::tcp::socket socket(ctx);

	register_context(ctx);
	const auto unregister = make_scope_exit([this, &ctx]() noexcept { unregister_context(ctx); });

	if (is_stopping())
		return std::nullopt;

	const auto stopping = [this] { return is_stopping(); };

	const auto close_socket = [&socket] {
		boost::system::error_code ignored_ec;
		socket.close(ignored_ec);
	};

	// connect
	{
		bool completed{false};
		boost::system::error_code ec;
		socket.async_connect(ip::tcp::endpoint(address, _port), [&](const boost::system::error_code& new_ec) {
			completed = true;
			ec = new_ec;
		});
		// close the socket to cancel the outstanding asynchronous operation
		if (!run_context_for(ctx, timeout, completed, stopping, close_socket) || ec) {
			SPDLOG_LOGGER_TRACE(_logger, "no answer from {}: {}", address.to_string(), ec.message());
			close_socket();
			return std::nullopt;
		}
	}

	std::array<char, protocol::max_reply_size> buffer;
	std::string reply;

	for (const auto command : inquiry_commands) {

		if (is_stopping()) {
			close_socket();
			return std::nullopt;
		}

		bool write_completed{false};
		boost::system::error_code write_ec;
		boost::asio::async_write(socket, boost::asio::buffer(command.data(), command.size()), [&](const boost::system::error_code& new_ec, std::size_t) {
			write_completed = true;
			write_ec = new_ec;
		});
		if (!run_context_for(ctx, timeout, write_completed, stopping, close_socket) || write_ec) {
			close_socket();
			return std::nullopt;
		}

		bool read_completed{false};
		boost::system::error_code read_ec;
		std::size_t size{};
		socket.async_read_some(boost::asio::buffer(buffer), [&](const boost::system::error_code& new_ec, std::size_t new_size) {
			read_completed = true;
			read_ec = new_ec;
			size = new_size;
		});
		const auto in_time = run_context_for(ctx, timeout, read_completed, stopping, [&socket, this, &close_socket] {
			if (is_stopping()) {
				close_socket();
			} else {
				// try next command on the same connection
				boost::system::error_code ignored_ec;
				socket.cancel(ignored_ec);
			}
		});

		if (!in_time)
			continue;

		if (read_ec) {
			// reset, eof and friends: not one of ours
			SPDLOG_LOGGER_TRACE(_logger, "read from {} failed: {}", address.to_string(), read_ec.message());
			close_socket();
			return std::nullopt;
		}

		if (size != 0) {
			reply = payload::decode_text(std::string_view(buffer.data(), size));
			break;
		}
	}

	close_socket();

	if (is_stopping())
		return std::nullopt;

	probe_result result;
	result._address = address;
	result._fields = parse_probe_reply(_db, reply);
	result._fields._source = discovery_source::ACTIVE;
	result._fields._reachable = true;
	result._reply = boost::trim_copy(reply);
	result._rtt = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

	_logger->debug("device answered on {} in {} ms", address.to_string(), result._rtt.count());

	return result;
}

void active_prober::stop() noexcept {
	_stopping = true;
	std::lock_guard<std::mutex> lk{_mtx_in_flight};
	for (auto ctx : _in_flight)
		ctx->stop();
}

void active_prober::reset() noexcept {
	_stopping = false;
}

bool active_prober::is_stopping() const noexcept {
	return _stopping;
}

std::vector<boost::asio::ip::address_v4> active_prober::hosts(const boost::asio::ip::network_v4& network, std::size_t max_hosts) {

	namespace ip = boost::asio::ip;

	std::vector<ip::address_v4> res;

	const auto canonical = network.canonical();

	if (canonical.prefix_length() == 31) {
		// point-to-point link, both addresses are hosts
		res.push_back(canonical.network());
		res.push_back(canonical.broadcast());
	} else {
		// includes the single address of a /32
		const auto range = canonical.hosts();
		for (auto it = range.begin(); it != range.end() && res.size() < max_hosts; ++it)
			res.push_back(*it);
	}

	if (res.size() > max_hosts)
		res.resize(max_hosts);

	return res;
}

std::optional<boost::asio::ip::address_v4> active_prober::default_interface_address() {

	namespace ip = boost::asio::ip;

	boost::asio::io_context ctx;
	boost::system::error_code ec;

	// connect on an UDP socket just selects the route: nothing is sent
	ip::udp::socket socket(ctx);
	socket.open(ip::udp::v4(), ec);
	if (!ec) {
		const ip::udp::endpoint remote(ip::make_address_v4(protocol::route_probe_address()), protocol::route_probe_port);
		socket.connect(remote, ec);
		if (!ec) {
			const auto local = socket.local_endpoint(ec);
			if (!ec && local.address().is_v4() && !local.address().is_unspecified())
				return local.address().to_v4();
		}
	}

	// fallback on host name resolution
	ip::udp::resolver resolver(ctx);
	const auto host_name = ip::host_name(ec);
	if (ec)
		return std::nullopt;
	const auto results = resolver.resolve(ip::udp::v4(), host_name, std::string{}, ec);
	if (ec)
		return std::nullopt;
	for (const auto& entry : results) {
		const auto address = entry.endpoint().address();
		if (address.is_v4())
			return address.to_v4();
	}

	return std::nullopt;
}

void active_prober::register_context(boost::asio::io_context& ctx) {
	std::lock_guard<std::mutex> lk{_mtx_in_flight};
	_in_flight.insert(&ctx);
}

void active_prober::unregister_context(boost::asio::io_context& ctx) noexcept {
	std::lock_guard<std::mutex> lk{_mtx_in_flight};
	_in_flight.erase(&ctx);
}

} // namespace rfscout
