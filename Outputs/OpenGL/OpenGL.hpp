//
//  OpenGL.hpp
//  Trichrome
//
//  Created by Thomas Harte on 07/02/2016.
//  Copyright 2016 Thomas Harte. All rights reserved.
//

#pragma once

#include "Outputs/Log.hpp"

#ifdef __APPLE__
	#include <OpenGL/OpenGL.h>
	#include <OpenGL/gl3.h>
	#include <OpenGL/gl3ext.h>
#else
#define GL_GLEXT_PROTOTYPES
#include <GL/gl.h>
#include <GL/glext.h>
#endif

namespace Outputs::Display::OpenGL {

constexpr const char *error_name(const GLenum error) {
	switch(error) {
		default:								return "unknown error";
		case GL_INVALID_ENUM:					return "GL_INVALID_ENUM";
		case GL_INVALID_VALUE:					return "GL_INVALID_VALUE";
		case GL_INVALID_OPERATION:				return "GL_INVALID_OPERATION";
		case GL_INVALID_FRAMEBUFFER_OPERATION:	return "GL_INVALID_FRAMEBUFFER_OPERATION";
		case GL_OUT_OF_MEMORY:					return "GL_OUT_OF_MEMORY";
	}
}

}

// Debug builds announce any GL error after each call made via test_gl; release builds make no check.
#ifndef NDEBUG

#define test_gl_error() { \
	const auto error = glGetError();	\
	if(error) { \
		Log::Logger<Log::Source::OpenGL>::error().append(	\
			"%s (%d) at line %d in %s",	\
			::Outputs::Display::OpenGL::error_name(error), int(error), __LINE__, __FILE__);	\
	}	\
}

#else
#define test_gl_error() while(false) {}
#endif

#ifndef NDEBUG
#define test_gl(command, ...) do { command(__VA_ARGS__); test_gl_error(); } while(false)
#else
#define test_gl(command, ...) command(__VA_ARGS__)
#endif
