//
//  FieldTypesTests.cpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#include <catch2/catch.hpp>

#include "RecordingTarget.hpp"

#include "Outputs/OpenGL/Vertex/FieldTypes.hpp"
#include "Reflection/VertexLayout.hpp"

using namespace Outputs::Display::OpenGL;

TEST_CASE("Field type shapes", "[vertex][types]") {
	STATIC_REQUIRE(Reflection::VertexFieldType<Vertex::Vec2f>);
	STATIC_REQUIRE(Reflection::VertexFieldType<Vertex::Vec3f>);
	STATIC_REQUIRE(Reflection::VertexFieldType<Vertex::Vec4f>);
	STATIC_REQUIRE(Reflection::VertexFieldType<Vertex::PackedRGBA>);
	STATIC_REQUIRE(Reflection::VertexFieldType<Vertex::I8>);
	STATIC_REQUIRE(Reflection::VertexFieldType<Vertex::I8Normalised>);
	STATIC_REQUIRE_FALSE(Reflection::VertexFieldType<float>);
	STATIC_REQUIRE_FALSE(Reflection::VertexFieldType<int8_t>);

	STATIC_REQUIRE(Vertex::Vec3f::components == 3);
	STATIC_REQUIRE(Vertex::PackedRGBA::components == 4);
	STATIC_REQUIRE(Vertex::PackedRGBA::normalised);
	STATIC_REQUIRE(Vertex::I8::integral);
	STATIC_REQUIRE_FALSE(Vertex::I8::normalised);
	STATIC_REQUIRE(Vertex::I8Normalised::normalised);
	STATIC_REQUIRE_FALSE(Vertex::I8Normalised::integral);
}

TEST_CASE("Packed colour bit layout", "[vertex][types]") {
	// Red in bits 0-9, green in 10-19, blue in 20-29, alpha in 30-31.
	STATIC_REQUIRE(Vertex::PackedRGBA(1.0f, 0.0f, 0.0f, 1.0f).packed == 0xc000'03ff);
	STATIC_REQUIRE(Vertex::PackedRGBA(0.0f, 1.0f, 0.0f, 1.0f).packed == 0xc00f'fc00);
	STATIC_REQUIRE(Vertex::PackedRGBA(0.0f, 0.0f, 1.0f, 1.0f).packed == 0xfff0'0000);
	STATIC_REQUIRE(Vertex::PackedRGBA(0.0f, 0.0f, 0.0f, 0.0f).packed == 0);
	STATIC_REQUIRE(Vertex::PackedRGBA(1.0f, 1.0f, 1.0f, 1.0f).packed == 0xffff'ffff);
}

TEST_CASE("Packed colour quantisation", "[vertex][types]") {
	// Rounds to nearest.
	STATIC_REQUIRE(Vertex::PackedRGBA(0.5f, 0.0f, 0.0f, 0.0f).packed == 512);
	STATIC_REQUIRE(Vertex::PackedRGBA(0.0f, 0.0f, 0.0f, 0.5f).packed == (2u << 30));

	// Clamps to [0, 1].
	STATIC_REQUIRE(Vertex::PackedRGBA(2.0f, -1.0f, 0.0f, 7.0f).packed == Vertex::PackedRGBA(1.0f, 0.0f, 0.0f, 1.0f).packed);

	const Vertex::PackedRGBA colour(0.25f, 0.5f, 0.75f, 1.0f);
	REQUIRE(colour.red() == Approx(0.25f).margin(1.0f / 1023.0f));
	REQUIRE(colour.green() == Approx(0.5f).margin(1.0f / 1023.0f));
	REQUIRE(colour.blue() == Approx(0.75f).margin(1.0f / 1023.0f));
	REQUIRE(colour.alpha() == 1.0f);
}

TEST_CASE("Field types describe themselves", "[vertex][types]") {
	RecordingTarget target;
	Vertex::Vec2f::describe(target, 20, 6, 12);
	Vertex::I8::describe(target, 20, 7, 19);
	Vertex::I8Normalised::describe(target, 20, 8, 18);

	REQUIRE(target.pointers.size() == 3);

	REQUIRE_FALSE(target.pointers[0].integral);
	REQUIRE(target.pointers[0].location == 6);
	REQUIRE(target.pointers[0].components == 2);
	REQUIRE(target.pointers[0].type == GL_FLOAT);
	REQUIRE(target.pointers[0].stride == 20);
	REQUIRE(target.pointers[0].offset == 12);

	REQUIRE(target.pointers[1].integral);
	REQUIRE(target.pointers[1].location == 7);
	REQUIRE(target.pointers[1].type == GL_BYTE);
	REQUIRE(target.pointers[1].offset == 19);

	REQUIRE_FALSE(target.pointers[2].integral);
	REQUIRE(target.pointers[2].normalised == GL_TRUE);
	REQUIRE(target.pointers[2].offset == 18);
}
