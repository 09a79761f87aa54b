//
//  Buffer.hpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#pragma once

#include "Outputs/OpenGL/OpenGL.hpp"

#include <cstddef>
#include <iterator>

namespace Outputs::Display::OpenGL {

/*!
	Owns a single GL buffer object, which is always bound to @c target.

	Buffers are move-only; a moved-from buffer holds no object and destroying it is a no-op.
*/
template <GLenum target>
class Buffer {
public:
	/// Creates a new, empty buffer object in the current context.
	Buffer();
	~Buffer();

	Buffer(Buffer &&);
	Buffer &operator =(Buffer &&);

	void bind() const;
	void unbind() const;

	/// @returns The number of bytes occupied by the contents of @c container.
	template <typename ContainerT>
	static constexpr size_t size_in_bytes(const ContainerT &container) {
		return std::size(container) * sizeof(*std::data(container));
	}

	/*!
		Binds this buffer, then replaces its contents with a copy of @c container, hinted
		as static draw data.

		@returns The number of bytes uploaded.
	*/
	template <typename ContainerT>
	size_t upload_static(const ContainerT &container) const {
		const auto size = size_in_bytes(container);
		bind();
		test_gl(glBufferData, target, GLsizeiptr(size), std::data(container), GL_STATIC_DRAW);
		return size;
	}

	GLuint handle() const {
		return buffer_;
	}

private:
	GLuint buffer_ = 0;
};

using ArrayBuffer = Buffer<GL_ARRAY_BUFFER>;
using ElementArrayBuffer = Buffer<GL_ELEMENT_ARRAY_BUFFER>;

extern template class Buffer<GL_ARRAY_BUFFER>;
extern template class Buffer<GL_ELEMENT_ARRAY_BUFFER>;

}
