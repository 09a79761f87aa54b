//
//  MalformedLocation.cpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

// Expected not to compile: 'colour' declares location -1.

#include "Outputs/OpenGL/Vertex/FieldTypes.hpp"
#include "Reflection/VertexLayout.hpp"

using namespace Outputs::Display::OpenGL;

struct Misplaced {
	BeginVertexFields(Misplaced);
	VertexField(0, Vertex::Vec3f, position);
	VertexField(-1, Vertex::PackedRGBA, colour);
};

size_t stride() {
	return Reflection::VertexLayout<Misplaced>::stride;
}
