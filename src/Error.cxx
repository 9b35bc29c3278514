// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later

#include "Error.hxx"

#include <fmt/core.h>

#include <utility>

static void
PrintErrorChain(std::exception_ptr ep, unsigned level) noexcept
{
	const unsigned indent = level * 2;

	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		fmt::print(stderr, "{:{}}{}\n", "", indent, e.what());

		try {
			std::rethrow_if_nested(e);
		} catch (...) {
			PrintErrorChain(std::current_exception(), level + 1);
		}
	} catch (...) {
		fmt::print(stderr, "{:{}}Unknown error\n", "", indent);
	}
}

void
PrintErrorChain(std::exception_ptr ep) noexcept
{
	PrintErrorChain(std::move(ep), 0);
}
