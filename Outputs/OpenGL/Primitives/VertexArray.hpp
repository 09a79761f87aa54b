//
//  VertexArray.hpp
//  Trichrome
//
//  Created by Thomas Harte on 29/01/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include "Outputs/OpenGL/OpenGL.hpp"
#include "Outputs/OpenGL/Primitives/AttributePointers.hpp"
#include "Outputs/OpenGL/Primitives/Buffer.hpp"
#include "Reflection/VertexLayout.hpp"

namespace Outputs::Display::OpenGL {

/*!
	Owns a vertex array object, which records how attribute locations read from buffers.
*/
class VertexArray {
public:
	VertexArray();
	~VertexArray();

	VertexArray(VertexArray &&);
	VertexArray &operator =(VertexArray &&);

	void bind() const;
	static void unbind();

	/*!
		Records in this vertex array the layout of @c RecordT as read from @c buffer,
		enabling every attribute location that @c RecordT declares.

		Neither this vertex array nor @c buffer is left bound.
	*/
	template <typename RecordT>
	void describe(const ArrayBuffer &buffer) const {
		bind();
		buffer.bind();

		AttributePointers pointers;
		Reflection::VertexLayout<RecordT>::apply(pointers);

		buffer.unbind();
		unbind();
	}

	GLuint handle() const {
		return vertex_array_;
	}

private:
	GLuint vertex_array_ = 0;
};

}
