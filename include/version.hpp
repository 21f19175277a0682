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
*	\file		version.hpp
*	\brief		Version
*
******************************************************************************/

#ifndef RFSCOUT_INCLUDE_VERSION_HPP_
#define RFSCOUT_INCLUDE_VERSION_HPP_

#define RFSCOUT_STR_HELPER(x)		#x
#define RFSCOUT_STR(x)				RFSCOUT_STR_HELPER(x)

#define RFSCOUT_VERSION_MAJOR		1
#define RFSCOUT_VERSION_MINOR		2
#define RFSCOUT_VERSION_PATCH		0
#define RFSCOUT_VERSION				(RFSCOUT_VERSION_MAJOR * 10000) + (RFSCOUT_VERSION_MINOR * 100) + (RFSCOUT_VERSION_PATCH)
#define RFSCOUT_VERSION_STRING		RFSCOUT_STR(RFSCOUT_VERSION_MAJOR) "." RFSCOUT_STR(RFSCOUT_VERSION_MINOR) "." RFSCOUT_STR(RFSCOUT_VERSION_PATCH)

#endif /* RFSCOUT_INCLUDE_VERSION_HPP_ */
