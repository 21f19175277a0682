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
*	\file		socket_option.hpp
*	\brief		Platform independent extension to Boost.ASIO socket options
*
******************************************************************************/

#ifndef RFSCOUT_INCLUDE_CPP_UTILITY_SOCKET_OPTION_HPP_
#define RFSCOUT_INCLUDE_CPP_UTILITY_SOCKET_OPTION_HPP_

#include <boost/asio.hpp>
#include <boost/predef/os.h>

#if BOOST_OS_MACOS || BOOST_OS_LINUX || BOOST_OS_BSD
#include <sys/socket.h>
#endif

namespace rfscout {

namespace socket_option {

#ifdef SO_REUSEPORT
#define RFSCOUT_HAS_REUSE_PORT
using reuse_port = boost::asio::detail::socket_option::boolean<BOOST_ASIO_OS_DEF(SOL_SOCKET), SO_REUSEPORT>;
#endif

} // namespace socket_option

} // namespace rfscout

#endif /* RFSCOUT_INCLUDE_CPP_UTILITY_SOCKET_OPTION_HPP_ */
