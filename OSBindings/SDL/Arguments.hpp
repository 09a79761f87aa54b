//
//  Arguments.hpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#pragma once

#include "Outputs/OpenGL/API.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace CommandLine {

struct ParsedArguments {
	std::vector<std::string> file_names;
	std::map<std::string, std::string> selections;	// The empty string will be inserted for arguments without an = suffix.

	std::optional<std::string> selection(const std::string &name) const;
};

/*! Parses an argc/argv pair to discern program arguments. */
ParsedArguments parse_arguments(int argc, const char *const argv[]);

std::string final_path_component(const std::string &path);

/// @returns The value of @c text if it is entirely a positive decimal number no greater than @c INT_MAX, or nothing otherwise.
std::optional<int> positive_number(const std::string &text);

struct Options {
	std::optional<std::string> assets;
	std::string shader = "shaders/triangle";
	int width = 800, height = 700;
	Outputs::Display::OpenGL::API api = Outputs::Display::OpenGL::API::OpenGL45Core;
	std::optional<size_t> frames;
};

/// Populates @c options from @c arguments; @returns the name of the first invalid option, if any.
std::optional<std::string> apply(const ParsedArguments &arguments, Options &options);

}
