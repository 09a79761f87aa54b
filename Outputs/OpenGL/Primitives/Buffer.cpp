//
//  Buffer.cpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#include "Buffer.hpp"

#include <utility>

using namespace Outputs::Display::OpenGL;

template <GLenum target>
Buffer<target>::Buffer() {
	test_gl(glGenBuffers, 1, &buffer_);
}

template <GLenum target>
Buffer<target>::~Buffer() {
	if(buffer_) {
		glDeleteBuffers(1, &buffer_);
	}
}

template <GLenum target>
Buffer<target>::Buffer(Buffer &&rhs) {
	*this = std::move(rhs);
}

template <GLenum target>
Buffer<target> &Buffer<target>::operator =(Buffer &&rhs) {
	std::swap(buffer_, rhs.buffer_);
	return *this;
}

template <GLenum target>
void Buffer<target>::bind() const {
	test_gl(glBindBuffer, target, buffer_);
}

template <GLenum target>
void Buffer<target>::unbind() const {
	test_gl(glBindBuffer, target, 0);
}

template class Outputs::Display::OpenGL::Buffer<GL_ARRAY_BUFFER>;
template class Outputs::Display::OpenGL::Buffer<GL_ELEMENT_ARRAY_BUFFER>;
