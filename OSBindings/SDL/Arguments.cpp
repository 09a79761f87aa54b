//
//  Arguments.cpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#include "Arguments.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>

using namespace CommandLine;

std::optional<std::string> ParsedArguments::selection(const std::string &name) const {
	const auto selection = selections.find(name);
	if(selection == selections.end()) return std::nullopt;
	return selection->second;
}

ParsedArguments CommandLine::parse_arguments(const int argc, const char *const argv[]) {
	ParsedArguments arguments;

	for(int index = 1; index < argc; ++index) {
		const char *arg = argv[index];

		// Accepted format is:
		//
		//	--flag			sets a Boolean option to true.
		//	--flag=value	sets the value for an option.
		//	name			is collected as a file name.
		if(arg[0] == '-') {
			while(*arg == '-') arg++;

			std::string argument = arg;
			std::size_t split_index = argument.find("=");

			if(split_index == std::string::npos) {
				arguments.selections[argument];	// To create an entry with the default empty string.
			} else {
				const std::string name = argument.substr(0, split_index);
				std::string value = argument.substr(split_index+1, std::string::npos);
				arguments.selections[name] = value;
			}
		} else {
			arguments.file_names.push_back(arg);
		}
	}

	return arguments;
}

std::string CommandLine::final_path_component(const std::string &path) {
	if(path.empty()) {
		return "";
	}

	auto final_slash = path.find_last_of("/\\");
	if(final_slash == std::string::npos) {
		return path;
	}

	// If a slash was found in the final position, remove it and recurse.
	if(final_slash == path.size() - 1) {
		return final_path_component(path.substr(0, path.size() - 1));
	}

	return path.substr(final_slash+1, path.size() - final_slash - 1);
}

std::optional<int> CommandLine::positive_number(const std::string &text) {
	if(text.empty()) return std::nullopt;

	char *end = nullptr;
	errno = 0;
	const long value = std::strtol(text.c_str(), &end, 10);
	if(*end || errno == ERANGE) return std::nullopt;
	if(value <= 0 || value > std::numeric_limits<int>::max()) return std::nullopt;
	return int(value);
}

std::optional<std::string> CommandLine::apply(const ParsedArguments &arguments, Options &options) {
	if(const auto assets = arguments.selection("assets")) {
		if(assets->empty()) return "assets";
		options.assets = *assets;
	}
	if(const auto shader = arguments.selection("shader")) {
		if(shader->empty()) return "shader";
		options.shader = *shader;
	}
	if(const auto width = arguments.selection("width")) {
		const auto value = positive_number(*width);
		if(!value) return "width";
		options.width = *value;
	}
	if(const auto height = arguments.selection("height")) {
		const auto value = positive_number(*height);
		if(!value) return "height";
		options.height = *value;
	}
	if(const auto api = arguments.selection("api")) {
		const auto value = Outputs::Display::OpenGL::api_named(*api);
		if(!value) return "api";
		options.api = *value;
	}
	if(const auto frames = arguments.selection("frames")) {
		const auto value = positive_number(*frames);
		if(!value) return "frames";
		options.frames = size_t(*value);
	}
	return std::nullopt;
}
