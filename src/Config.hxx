// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "WalkOptions.hxx"

/**
 * A walk profile loaded from a configuration file.
 */
struct Config {
	WalkOptions walk;
};

/**
 * Load a walk profile.  Each line contains a command and an optional
 * value; empty lines and lines starting with '#' are ignored.
 *
 * Throws on error.
 */
Config
LoadConfigFile(const char *path);
