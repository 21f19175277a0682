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
*	\file		library_logger.hpp
*	\brief		Logger
*
******************************************************************************/

#ifndef RFSCOUT_INCLUDE_LIBRARY_LOGGER_HPP_
#define RFSCOUT_INCLUDE_LIBRARY_LOGGER_HPP_

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h> // required to print custom objects

namespace rfscout {

namespace library_logger {

/**
 * Initialize the logger stuff and print version of included libraries on the main sink
 * @param default_level	level used when SPDLOG_LEVEL is not set
 */
void init(spdlog::level::level_enum default_level = spdlog::level::info);

/**
 * Create a new logger to print on the main sink
 * @param name		the logger name
 * @return a new logger instance
 */
std::shared_ptr<spdlog::logger> create_logger(const std::string& name);

/**
 * Create a new logger to print on the main sink with custom optional level
 * @param name		the logger name
 * @param level		optional logger level to override default level
 * @return a new logger instance
 */
std::shared_ptr<spdlog::logger> create_logger(const std::string& name, const std::optional<spdlog::level::level_enum>& level);

} // namespace library_logger

} // namespace rfscout

#endif /* RFSCOUT_INCLUDE_LIBRARY_LOGGER_HPP_ */
