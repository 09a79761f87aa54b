//
//  AttributePointers.cpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#include "AttributePointers.hpp"

using namespace Outputs::Display::OpenGL;

namespace {
using Logger = Log::Logger<Log::Source::OpenGL>;

const GLvoid *buffer_offset(const size_t offset) {
	return reinterpret_cast<const GLvoid *>(offset);
}
}

void AttributePointers::float_pointer(
	const GLuint location,
	const GLint components,
	const GLenum type,
	const GLboolean normalised,
	const GLsizei stride,
	const size_t offset
) {
	Logger::info().append(
		"Attribute %u: %d x 0x%04x%s, stride %d, offset %zu",
		location, components, type, normalised ? " (normalised)" : "", stride, offset);
	test_gl(glEnableVertexAttribArray, location);
	test_gl(glVertexAttribPointer, location, components, type, normalised, stride, buffer_offset(offset));
}

void AttributePointers::integer_pointer(
	const GLuint location,
	const GLint components,
	const GLenum type,
	const GLsizei stride,
	const size_t offset
) {
	Logger::info().append(
		"Attribute %u: %d x 0x%04x (integer), stride %d, offset %zu",
		location, components, type, stride, offset);
	test_gl(glEnableVertexAttribArray, location);
	test_gl(glVertexAttribIPointer, location, components, type, stride, buffer_offset(offset));
}
