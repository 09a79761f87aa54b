//
//  NotFlat.cpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

// Expected not to compile: records may not be polymorphic.

#include "Outputs/OpenGL/Vertex/FieldTypes.hpp"
#include "Reflection/VertexLayout.hpp"

using namespace Outputs::Display::OpenGL;

struct Virtual {
	BeginVertexFields(Virtual);
	VertexField(0, Vertex::Vec3f, position);

	virtual ~Virtual() = default;
};

size_t stride() {
	return Reflection::VertexLayout<Virtual>::stride;
}
