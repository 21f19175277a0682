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
*	\file		run_context.hpp
*	\brief		Bounded run of a Boost.Asio io_context
*
******************************************************************************/

#ifndef RFSCOUT_INCLUDE_CPP_UTILITY_RUN_CONTEXT_HPP_
#define RFSCOUT_INCLUDE_CPP_UTILITY_RUN_CONTEXT_HPP_

#include <utility>

#include <boost/asio/io_context.hpp>

namespace rfscout {

/**
 * Run the context until the pending operation completes or the timeout expires. On timeout,
 * or if stopped() holds after the context restart, cancel_callback is invoked and the context
 * is run again until the handler of the cancelled operation sets completed.
 * See example at
 * https://www.boost.org/doc/libs/1_67_0/doc/html/boost_asio/example/cpp03/timeouts/blocking_tcp_client.cpp
 * @param stopped	checked after restart(), so that an io_context::stop() issued before is not lost
 * @return false if the operation did not complete within the timeout
 */
template <typename Duration, typename StopPredicate, typename Callable>
bool run_context_for(boost::asio::io_context& ctx, Duration&& timeout, const bool& completed, StopPredicate stopped, Callable cancel_callback) {
	ctx.restart();
	if (!stopped())
		ctx.run_for(std::forward<Duration>(timeout));
	if (completed)
		return true;
	cancel_callback();
	while (!completed) {
		ctx.restart();
		ctx.run();
	}
	return false;
}

} // namespace rfscout

#endif /* RFSCOUT_INCLUDE_CPP_UTILITY_RUN_CONTEXT_HPP_ */
