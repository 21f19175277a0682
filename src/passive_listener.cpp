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
*	\file		passive_listener.cpp
*	\brief		Multicast announcement listener
*
******************************************************************************/

#include "passive_listener.hpp"

#include <utility>

#include <boost/asio.hpp>
#include <spdlog/fmt/fmt.h>

#include "classification.hpp"
#include "cpp-utility/run_context.hpp"
#include "cpp-utility/socket_option.hpp"
#include "lib_error.hpp"
#include "library_logger.hpp"
#include "payload_parser.hpp"

using namespace std::literals;

namespace rfscout {

passive_listener::passive_listener(const device_class_database& db, discovery_registry& registry)
: passive_listener(db, registry, boost::asio::ip::make_address_v4(protocol::multicast_group()), protocol::multicast_port) {
}

passive_listener::passive_listener(const device_class_database& db, discovery_registry& registry, boost::asio::ip::address_v4 group, std::uint16_t port)
: _logger{library_logger::create_logger("passive"s)}
, _db(db)
, _registry(registry)
, _group(std::move(group))
, _port{port}
, _io_context{}
, _socket(_io_context)
, _remote_ep{}
, _buffer{}
, _interrupted{false} {
}

passive_listener::~passive_listener() {
	close();
}

void passive_listener::open() {

	namespace ip = boost::asio::ip;

	close();

	boost::system::error_code ec;

	_socket.open(ip::udp::v4(), ec);
	if (ec)
		throw ex::socket_error(fmt::format("multicast socket open failed: {}", ec.message()));

	_socket.set_option(ip::udp::socket::reuse_address(true), ec);
	if (ec)
		_logger->debug("reuse_address not set: {}", ec.message());

#ifdef RFSCOUT_HAS_REUSE_PORT
	_socket.set_option(socket_option::reuse_port(true), ec);
	if (ec)
		_logger->debug("reuse_port not set: {}", ec.message());
#endif

	// some platforms do not allow binding on a multicast address
	_socket.bind(ip::udp::endpoint(_group, _port), ec);
	if (ec) {
		SPDLOG_LOGGER_DEBUG(_logger, "bind on {}:{} failed ({}), falling back to wildcard address", _group.to_string(), _port, ec.message());
		_socket.bind(ip::udp::endpoint(ip::address_v4::any(), _port), ec);
		if (ec) {
			const auto msg = ec.message();
			close();
			throw ex::socket_error(fmt::format("multicast socket bind on port {} failed: {}", _port, msg));
		}
	}

	_socket.set_option(ip::multicast::join_group(_group), ec);
	if (ec) {
		const auto msg = ec.message();
		close();
		throw ex::socket_error(fmt::format("join multicast group {} failed: {}", _group.to_string(), msg));
	}

	const auto local_ep = _socket.local_endpoint(ec);
	_logger->info("listening on {}:{}", local_ep.address().to_string(), local_ep.port());
}

void passive_listener::close() noexcept {
	if (!_socket.is_open())
		return;
	boost::system::error_code ec;
	_socket.close(ec);
	if (ec)
		_logger->warn("socket close failed: {}", ec.message());
}

bool passive_listener::is_open() const noexcept {
	return _socket.is_open();
}

bool passive_listener::receive_for(std::chrono::milliseconds timeout) {

	if (!_socket.is_open())
		throw ex::socket_error("multicast socket not open"s);

	bool completed{false};
	boost::system::error_code ec;
	std::size_t size{};

	_socket.async_receive_from(boost::asio::buffer(_buffer), _remote_ep, [&](const boost::system::error_code& new_ec, std::size_t new_size) {
		completed = true;
		ec = new_ec;
		size = new_size;
	});

	// timeout or interrupt: cancel the outstanding operation and wait for its handler
	run_context_for(_io_context, timeout, completed, [this] { return _interrupted.load(); }, [this] {
		boost::system::error_code cancel_ec;
		_socket.cancel(cancel_ec);
	});
	_interrupted = false;

	if (ec == boost::asio::error::operation_aborted)
		return false;

	if (ec)
		throw ex::socket_error(fmt::format("multicast receive failed: {}", ec.message()));

	handle_datagram(std::string_view(_buffer.data(), size), _remote_ep.address().to_string());

	return true;
}

void passive_listener::interrupt() noexcept {
	_interrupted = true;
	_io_context.stop();
}

bool passive_listener::handle_datagram(std::string_view raw, const std::string& remote_ip) {

	const auto text = payload::decode_text(raw);
	const auto class_id = payload::find_class_id(text);

	// announcements from unrelated services are expected on the same group
	if (class_id.empty()) {
		SPDLOG_LOGGER_TRACE(_logger, "datagram from {} without class id", remote_ip);
		return false;
	}

	auto fields = classify(_db, class_id);
	fields._source = discovery_source::PASSIVE;
	fields._reachable = true;

	if (!fields._model)
		_logger->debug("discovery packet from {} referenced unknown DCID {}", remote_ip, class_id);

	_registry.upsert(remote_ip, fields);

	return true;
}

std::uint16_t passive_listener::local_port() const {
	return _socket.local_endpoint().port();
}

} // namespace rfscout
