//
//  AttributePointers.hpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#pragma once

#include "Outputs/OpenGL/OpenGL.hpp"

#include <cstddef>

namespace Outputs::Display::OpenGL {

/*!
	The attribute target used with the current context: enables each attribute location
	it is told about and points it into whichever buffer is currently bound to @c GL_ARRAY_BUFFER.
*/
struct AttributePointers {
	void float_pointer(GLuint location, GLint components, GLenum type, GLboolean normalised, GLsizei stride, size_t offset);
	void integer_pointer(GLuint location, GLint components, GLenum type, GLsizei stride, size_t offset);
};

}
