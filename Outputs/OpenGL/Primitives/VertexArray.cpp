//
//  VertexArray.cpp
//  Trichrome
//
//  Created by Thomas Harte on 29/01/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include "VertexArray.hpp"

#include <utility>

using namespace Outputs::Display::OpenGL;

VertexArray::VertexArray() {
	test_gl(glGenVertexArrays, 1, &vertex_array_);
}

VertexArray::~VertexArray() {
	if(vertex_array_) {
		glDeleteVertexArrays(1, &vertex_array_);
	}
}

VertexArray::VertexArray(VertexArray &&rhs) {
	*this = std::move(rhs);
}

VertexArray &VertexArray::operator =(VertexArray &&rhs) {
	std::swap(vertex_array_, rhs.vertex_array_);
	return *this;
}

void VertexArray::bind() const {
	test_gl(glBindVertexArray, vertex_array_);
}

void VertexArray::unbind() {
	test_gl(glBindVertexArray, 0);
}
