/******************************************************************************
*
*	CAEN SpA - Software Division
*	Via Vetraia, 11 - 55049 - Viareggio ITALY
*	+39 0594 388 398 - www.caen.it
*
*******************************************************************************
*
*	Copyright (C) 2020-2023 CAEN SpA
*
*	This file is part of the CAEN SSDP Discover Tool.
*
*	The CAEN SSDP Discover Tool is free software; you can redistribute it and/or
*	modify it under the terms of the GNU Lesser General Public
*	License as published by the Free Software Foundation; either
*	version 3 of the License, or (at your option) any later version.
*
*	The CAEN SSDP Discover Tool is distributed in the hope that it will be useful,
*	but WITHOUT ANY WARRANTY; without even the implied warranty of
*	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
*	Lesser General Public License for more details.
*
*	You should have received a copy of the GNU Lesser General Public
*	License along with the CAEN SSDP Discover Tool; if not, see
*	https://www.gnu.org/licenses/.
*
*	SPDX-License-Identifier: LGPL-3.0-or-later
*
***************************************************************************//*!
*
*	\file		scope_exit.hpp
*	\brief		Scope guard, inspired to TS v3 `std::experimental::scope_exit`
*
******************************************************************************/

#ifndef CAEN_SSDP_INCLUDE_CPP_UTILITY_SCOPE_EXIT_HPP_
#define CAEN_SSDP_INCLUDE_CPP_UTILITY_SCOPE_EXIT_HPP_

#include <type_traits>
#include <utility>

namespace caen {

/**
 * Invoke a callable when leaving the scope, unless released.
 * The callable must not throw.
 */
template <typename Function>
struct scope_exit {

	explicit scope_exit(Function f) noexcept(std::is_nothrow_move_constructible<Function>::value)
	: _f(std::move(f))
	, _active{true} {}

	scope_exit(scope_exit&& other) noexcept(std::is_nothrow_move_constructible<Function>::value)
	: _f(std::move(other._f))
	, _active{other._active} {
		other.release();
	}

	scope_exit(const scope_exit&) = delete;
	scope_exit& operator=(const scope_exit&) = delete;
	scope_exit& operator=(scope_exit&&) = delete;

	~scope_exit() {
		if (_active)
			_f();
	}

	void release() noexcept {
		_active = false;
	}

private:
	Function _f;
	bool _active;
};

template <typename Function>
scope_exit<std::decay_t<Function>> make_scope_exit(Function&& f) {
	return scope_exit<std::decay_t<Function>>(std::forward<Function>(f));
}

} // namespace caen

#endif /* CAEN_SSDP_INCLUDE_CPP_UTILITY_SCOPE_EXIT_HPP_ */
