//
//  API.hpp
//  Trichrome
//
//  Created by Thomas Harte on 16/12/2025.
//  Copyright © 2025 Thomas Harte. All rights reserved.
//

#pragma once

#include <optional>
#include <string>

namespace Outputs::Display::OpenGL {

/// The context profiles that a window may be asked to provide.
enum class API {
	OpenGL45Core,
	OpenGL32Core,
};

constexpr int major_version(const API api) {
	switch(api) {
		default:
		case API::OpenGL45Core:	return 4;
		case API::OpenGL32Core:	return 3;
	}
}

constexpr int minor_version(const API api) {
	switch(api) {
		default:
		case API::OpenGL45Core:	return 5;
		case API::OpenGL32Core:	return 2;
	}
}

/// Maps the command-line spellings `core45` and `core32` to an API; anything else maps to nothing.
inline std::optional<API> api_named(const std::string &name) {
	if(name == "core45") return API::OpenGL45Core;
	if(name == "core32") return API::OpenGL32Core;
	return std::nullopt;
}

}
