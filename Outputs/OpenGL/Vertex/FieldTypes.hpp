//
//  FieldTypes.hpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#pragma once

#include "Outputs/OpenGL/OpenGL.hpp"

#include <cstddef>
#include <cstdint>

namespace Outputs::Display::OpenGL::Vertex {

/*!
	Supplies the means by which a vertex field type describes itself to an attribute target.

	An attribute target is anything offering:

		void float_pointer(GLuint location, GLint components, GLenum type, GLboolean normalised, GLsizei stride, size_t offset);
		void integer_pointer(GLuint location, GLint components, GLenum type, GLsizei stride, size_t offset);

	Which mirror @c glVertexAttribPointer and @c glVertexAttribIPointer respectively; see
	@c AttributePointers for the implementation that talks to the current context.
*/
template <GLint components_, GLenum element_type_, bool normalised_, bool integral_ = false>
struct Attribute {
	static constexpr GLint components = components_;
	static constexpr GLenum element_type = element_type_;
	static constexpr bool normalised = normalised_;
	static constexpr bool integral = integral_;

	static_assert(!(normalised && integral), "Integral attributes are never normalised");

	/*!
		Registers with @c target that @c components elements of @c element_type can be read from
		@c offset bytes into each @c stride -sized record, supplying the attribute at @c location.
	*/
	template <typename TargetT>
	static void describe(TargetT &target, const GLsizei stride, const GLuint location, const size_t offset) {
		if constexpr (integral) {
			target.integer_pointer(location, components, element_type, stride, offset);
		} else {
			target.float_pointer(location, components, element_type, normalised ? GL_TRUE : GL_FALSE, stride, offset);
		}
	}
};

struct Vec2f: public Attribute<2, GL_FLOAT, false> {
	constexpr Vec2f() = default;
	constexpr Vec2f(const GLfloat x, const GLfloat y) : x(x), y(y) {}

	GLfloat x = 0.0f, y = 0.0f;
};

struct Vec3f: public Attribute<3, GL_FLOAT, false> {
	constexpr Vec3f() = default;
	constexpr Vec3f(const GLfloat x, const GLfloat y, const GLfloat z) : x(x), y(y), z(z) {}

	GLfloat x = 0.0f, y = 0.0f, z = 0.0f;
};

struct Vec4f: public Attribute<4, GL_FLOAT, false> {
	constexpr Vec4f() = default;
	constexpr Vec4f(const GLfloat x, const GLfloat y, const GLfloat z, const GLfloat w) : x(x), y(y), z(z), w(w) {}

	GLfloat x = 0.0f, y = 0.0f, z = 0.0f, w = 0.0f;
};

/*!
	Four normalised unsigned components packed into a single 32-bit word, in the
	layout of @c GL_UNSIGNED_INT_2_10_10_10_REV:

		bits 0-9:		red, as round(r * 1023);
		bits 10-19:		green, as round(g * 1023);
		bits 20-29:		blue, as round(b * 1023);
		bits 30-31:		alpha, as round(a * 3).

	All inputs are clamped to [0, 1] before packing. The word is stored in host order, which
	is what GL expects of a packed type.
*/
struct PackedRGBA: public Attribute<4, GL_UNSIGNED_INT_2_10_10_10_REV, true> {
	constexpr PackedRGBA() = default;
	constexpr PackedRGBA(const float red, const float green, const float blue, const float alpha) :
		packed(
			quantise(red, 1023) |
			(quantise(green, 1023) << 10) |
			(quantise(blue, 1023) << 20) |
			(quantise(alpha, 3) << 30)
		) {}

	constexpr float red() const		{	return float(packed & 1023) / 1023.0f;			}
	constexpr float green() const	{	return float((packed >> 10) & 1023) / 1023.0f;	}
	constexpr float blue() const	{	return float((packed >> 20) & 1023) / 1023.0f;	}
	constexpr float alpha() const	{	return float(packed >> 30) / 3.0f;				}

	uint32_t packed = 0;

private:
	static constexpr uint32_t quantise(const float value, const uint32_t max) {
		const float clamped = value < 0.0f ? 0.0f : (value > 1.0f ? 1.0f : value);
		return uint32_t(clamped * float(max) + 0.5f);
	}
};

/// A single signed byte, presented to the shader as an integer.
struct I8: public Attribute<1, GL_BYTE, false, true> {
	constexpr I8() = default;
	constexpr I8(const int8_t value) : value(value) {}

	int8_t value = 0;
};

/// A single signed byte, presented to the shader as a float in [-1, 1].
struct I8Normalised: public Attribute<1, GL_BYTE, true> {
	constexpr I8Normalised() = default;
	constexpr I8Normalised(const int8_t value) : value(value) {}

	int8_t value = 0;
};

static_assert(sizeof(Vec2f) == 8);
static_assert(sizeof(Vec3f) == 12);
static_assert(sizeof(Vec4f) == 16);
static_assert(sizeof(PackedRGBA) == 4);
static_assert(sizeof(I8) == 1);
static_assert(sizeof(I8Normalised) == 1);

}
