//
//  TriangleScene.cpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#include "TriangleScene.hpp"

using namespace Outputs::Display::OpenGL;

namespace {
using Logger = Log::Logger<Log::Source::OpenGL>;
}

TriangleScene::TriangleScene(
	const Storage::ResourceLoader &loader,
	const std::string &shader_name,
	const ClearColour clear_colour
) : program_(Program::from_resources(loader, shader_name)) {
	const auto vertices = triangle_vertices();
	const auto size = vertices_.upload_static(vertices);
	vertices_.unbind();
	vertex_count_ = GLsizei(vertices.size());
	Logger::info().append("Uploaded %d vertices in %zu bytes", vertex_count_, size);

	vertex_array_.describe<ColouredVertex>(vertices_);

	test_gl(glClearColor, clear_colour.red, clear_colour.green, clear_colour.blue, clear_colour.alpha);
}

void TriangleScene::set_viewport(const int width, const int height) {
	test_gl(glViewport, 0, 0, width, height);
}

void TriangleScene::draw() {
	test_gl(glClear, GL_COLOR_BUFFER_BIT);

	program_.bind();
	vertex_array_.bind();
	test_gl(glDrawArrays, GL_TRIANGLES, 0, vertex_count_);
	VertexArray::unbind();
}
