//
//  TriangleScene.hpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#pragma once

#include "Outputs/OpenGL/FrameLoop.hpp"
#include "Outputs/OpenGL/OpenGL.hpp"
#include "Outputs/OpenGL/Primitives/Buffer.hpp"
#include "Outputs/OpenGL/Primitives/Shader.hpp"
#include "Outputs/OpenGL/Primitives/VertexArray.hpp"
#include "Outputs/OpenGL/Vertex/FieldTypes.hpp"
#include "Reflection/VertexLayout.hpp"
#include "Storage/Resources.hpp"

#include <array>
#include <string>

namespace Outputs::Display::OpenGL {

struct ColouredVertex {
	BeginVertexFields(ColouredVertex);
	VertexField(0, Vertex::Vec3f, position);
	VertexField(1, Vertex::PackedRGBA, colour);
};

/// A single triangle with a red, a green and a blue corner.
constexpr std::array<ColouredVertex, 3> triangle_vertices() {
	return {
		ColouredVertex{{0.5f, -0.5f, 0.0f}, {1.0f, 0.0f, 0.0f, 1.0f}},
		ColouredVertex{{-0.5f, -0.5f, 0.0f}, {0.0f, 1.0f, 0.0f, 1.0f}},
		ColouredVertex{{0.0f, 0.5f, 0.0f}, {0.0f, 0.0f, 1.0f, 1.0f}},
	};
}

struct ClearColour {
	GLfloat red, green, blue, alpha;
};

/*!
	Draws @c triangle_vertices() with the program built from the shader resources
	named @c shader_name, over a solid background.
*/
class TriangleScene: public Scene {
public:
	/// Requires a current context; @throws ShaderError if the program cannot be built.
	TriangleScene(
		const Storage::ResourceLoader &loader,
		const std::string &shader_name,
		ClearColour clear_colour = {0.24f, 0.7f, 0.5f, 1.0f});

	void set_viewport(int width, int height) override;
	void draw() override;

private:
	Program program_;
	ArrayBuffer vertices_;
	VertexArray vertex_array_;
	GLsizei vertex_count_ = 0;
};

}
