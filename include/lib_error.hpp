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
*	\file		lib_error.hpp
*	\brief		Exceptions
*
******************************************************************************/

#ifndef RFSCOUT_INCLUDE_LIB_ERROR_HPP_
#define RFSCOUT_INCLUDE_LIB_ERROR_HPP_

#include <exception>
#include <stdexcept>
#include <string>

namespace rfscout {

namespace ex {

using namespace std::string_literals;

struct runtime_error : public std::runtime_error {
	using std::runtime_error::runtime_error;
};

struct stop : public ex::runtime_error {
	stop() : runtime_error("stop"s) {}
};

struct invalid_argument : public std::invalid_argument {
	using std::invalid_argument::invalid_argument;
};

struct file_error : public ex::runtime_error {
	using ex::runtime_error::runtime_error;
};

struct socket_error : public ex::runtime_error {
	using ex::runtime_error::runtime_error;
};

} // namespace ex

/**
 * @brief UDL to generate ex::runtime_error with compile-time defined message.
 *
 * Example:
 * @code
 * throw "generic error"_ex;
 * @endcode
 */
inline auto operator""_ex(const char* str, std::size_t len) {
	return ex::runtime_error(std::string(str, len));
}

} // namespace rfscout

#endif /* RFSCOUT_INCLUDE_LIB_ERROR_HPP_ */
