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
*	\file		scope_exit.hpp
*	\brief		Scope guard
*
******************************************************************************/

#ifndef RFSCOUT_INCLUDE_CPP_UTILITY_SCOPE_EXIT_HPP_
#define RFSCOUT_INCLUDE_CPP_UTILITY_SCOPE_EXIT_HPP_

#include <type_traits>
#include <utility>

namespace rfscout {

/**
 * Invoke a callable when leaving the scope.
 * The callable must not throw.
 */
template <typename Function>
struct scope_exit {

	explicit scope_exit(Function f) noexcept(std::is_nothrow_move_constructible<Function>::value)
		: _f(std::move(f))
		, _active{true} {}

	scope_exit(scope_exit&& other) noexcept(std::is_nothrow_move_constructible<Function>::value)
		: _f(std::move(other._f))
		, _active{std::exchange(other._active, false)} {}

	scope_exit(const scope_exit&) = delete;
	scope_exit& operator=(const scope_exit&) = delete;
	scope_exit& operator=(scope_exit&&) = delete;

	~scope_exit() {
		if (_active)
			_f();
	}

private:
	Function _f;
	bool _active;
};

template <typename Function>
scope_exit<std::decay_t<Function>> make_scope_exit(Function&& f) {
	return scope_exit<std::decay_t<Function>>(std::forward<Function>(f));
}

} // namespace rfscout

#endif /* RFSCOUT_INCLUDE_CPP_UTILITY_SCOPE_EXIT_HPP_ */
