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
*	\file		classification.hpp
*	\brief		Classification of class ids
*
******************************************************************************/

#ifndef RFSCOUT_INCLUDE_CLASSIFICATION_HPP_
#define RFSCOUT_INCLUDE_CLASSIFICATION_HPP_

#include <string>

#include "device_class_database.hpp"
#include "discovery_registry.hpp"

namespace rfscout {

/**
 * Fill the registry fields known from a class id: model, band, device type and channels.
 * An unknown class id yields fields with only the class id set.
 */
device_fields classify(const device_class_database& db, const std::string& class_id);

} // namespace rfscout

#endif /* RFSCOUT_INCLUDE_CLASSIFICATION_HPP_ */
