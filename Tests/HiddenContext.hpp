//
//  HiddenContext.hpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#pragma once

#include "Outputs/OpenGL/OpenGL.hpp"

#include <SDL2/SDL.h>

#include <string>

/*!
	A hidden window with a current 3.2 core context, if this environment can provide one.
*/
class HiddenContext {
public:
	HiddenContext() {
		if(SDL_Init(SDL_INIT_VIDEO) < 0) {
			failure_ = SDL_GetError();
			return;
		}
		initialised_ = true;

		SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
		SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
		SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 2);

		window_ = SDL_CreateWindow("trichrome_gl_tests", 0, 0, 64, 64, SDL_WINDOW_OPENGL | SDL_WINDOW_HIDDEN);
		if(window_) {
			context_ = SDL_GL_CreateContext(window_);
		}
		if(!context_) {
			failure_ = SDL_GetError();
			return;
		}
		SDL_GL_MakeCurrent(window_, context_);
	}

	~HiddenContext() {
		if(context_) SDL_GL_DeleteContext(context_);
		if(window_) SDL_DestroyWindow(window_);
		if(initialised_) SDL_Quit();
	}

	HiddenContext(const HiddenContext &) = delete;
	HiddenContext &operator =(const HiddenContext &) = delete;

	explicit operator bool() const {
		return context_ != nullptr;
	}

	const std::string &failure() const {
		return failure_;
	}

private:
	bool initialised_ = false;
	SDL_Window *window_ = nullptr;
	SDL_GLContext context_ = nullptr;
	std::string failure_;
};
