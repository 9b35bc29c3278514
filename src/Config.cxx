// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Config.hxx"

#include <fmt/format.h>

#include <charconv>
#include <exception> // for std::throw_with_nested()
#include <fstream>
#include <stdexcept>
#include <string>

#include <errno.h>

using std::string_view_literals::operator""sv;

static constexpr bool
IsWhitespace(char ch) noexcept
{
	return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
}

static constexpr bool
IsCommandChar(char ch) noexcept
{
	return ch >= 'a' && ch <= 'z';
}

static constexpr std::string_view
Strip(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespace(s.front()))
		s.remove_prefix(1);

	while (!s.empty() && IsWhitespace(s.back()))
		s.remove_suffix(1);

	return s;
}

static std::pair<std::string_view, std::string_view>
ExtractCommandValue(std::string_view line)
{
	std::size_t i = 0;
	while (i < line.size() && IsCommandChar(line[i]))
		++i;

	const std::string_view command = line.substr(0, i);
	if (command.empty())
		throw std::runtime_error{"No command"};

	if (i < line.size() && !IsWhitespace(line[i]))
		throw std::runtime_error{"Malformed command"};

	return {command, Strip(line.substr(i))};
}

static int
ParseDepth(std::string_view s)
{
	const char *const first = s.data(), *const last = first + s.size();

	int value;
	auto [ptr, ec] = std::from_chars(first, last, value, 10);
	if (ptr == first || ptr != last || ec != std::errc{})
		throw std::runtime_error{"Malformed number"};

	return value;
}

static void
RequireValue(std::string_view value)
{
	if (value.empty())
		throw std::runtime_error{"Value expected"};
}

static void
RequireNoValue(std::string_view value)
{
	if (!value.empty())
		throw std::runtime_error{"Unexpected value"};
}

template<typename T>
static void
Append(std::optional<std::vector<T>> &list, T &&value)
{
	if (!list)
		list.emplace();

	list->push_back(std::move(value));
}

static void
ParseLine(WalkOptions &options, std::string_view line)
{
	const auto [command, value] = ExtractCommandValue(line);
	if (command == "maxdepth"sv) {
		RequireValue(value);
		options.max_depth = ParseDepth(value);
	} else if (command == "ext"sv) {
		RequireValue(value);
		Append(options.exts, std::string{value});
	} else if (command == "match"sv) {
		RequireValue(value);
		Append(options.match, std::regex{value.begin(), value.end()});
	} else if (command == "skip"sv) {
		RequireValue(value);
		Append(options.skip, std::regex{value.begin(), value.end()});
	} else if (command == "follow"sv) {
		RequireNoValue(value);
		options.follow_symlinks = true;
	} else if (command == "nofiles"sv) {
		RequireNoValue(value);
		options.include_files = false;
	} else if (command == "nodirs"sv) {
		RequireNoValue(value);
		options.include_dirs = false;
	} else
		throw std::runtime_error{fmt::format("Unknown command {:?}", command)};
}

Config
LoadConfigFile(const char *path)
{
	std::ifstream file{path};
	if (!file)
		throw fmt::system_error(errno, "Failed to open {:?}", std::string_view{path});

	Config config;

	std::string buffer;
	unsigned line_number = 0;
	while (std::getline(file, buffer)) {
		++line_number;

		const auto line = Strip(buffer);
		if (line.empty() || line.front() == '#')
			continue;

		try {
			ParseLine(config.walk, line);
		} catch (...) {
			std::throw_with_nested(std::runtime_error{
				fmt::format("Error in {:?} line {}", std::string_view{path}, line_number),
			});
		}
	}

	if (file.bad())
		throw fmt::system_error(errno, "Failed to read {:?}", std::string_view{path});

	return config;
}
