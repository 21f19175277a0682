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
*	\file		classification.cpp
*	\brief		Classification of class ids
*
******************************************************************************/

#include "classification.hpp"

namespace rfscout {

device_fields classify(const device_class_database& db, const std::string& class_id) {
	device_fields fields;
	if (class_id.empty())
		return fields;
	fields._class_id = class_id;
	const auto entry = db.lookup_by_class_id(class_id);
	if (!entry)
		return fields;
	fields._model = entry->display_name();
	fields._band = entry->_band;
	const auto info = device_class_database::lookup_model_by_name(entry->_model_key);
	if (info) {
		fields._type = info->_type;
		fields._channels = info->_channels;
	}
	return fields;
}

} // namespace rfscout
