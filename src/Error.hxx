// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later

#pragma once

#include <exception>
#include <stdexcept>

/**
 * A directory listing returned a record without a name.
 */
class CorruptListingError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * Print the message of the given exception to stderr, followed by
 * the messages of the exceptions nested in it, one per line and
 * indented.
 */
void
PrintErrorChain(std::exception_ptr ep) noexcept;
