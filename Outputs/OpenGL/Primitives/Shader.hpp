//
//  Shader.hpp
//  Trichrome
//
//  Created by Thomas Harte on 07/02/2016.
//  Copyright 2016 Thomas Harte. All rights reserved.
//

#pragma once

#include "Outputs/OpenGL/OpenGL.hpp"
#include "Storage/Resources.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace Outputs::Display::OpenGL {

class ShaderError: public std::runtime_error {
public:
	enum class Type {
		/// The source for a stage could not be loaded; the @c Storage::ResourceError is nested.
		ResourceLoad,
		/// The stage could not be determined from the resource name.
		UnknownStage,
		/// The driver rejected a stage; @c log() holds its diagnostics.
		Compilation,
		/// The driver could not link the program; @c log() holds its diagnostics.
		Linkage,
	};

	ShaderError(Type type, const std::string &name, const std::string &log = "");

	Type type() const {
		return type_;
	}

	/// The logical name of the resource or program at fault.
	const std::string &name() const {
		return name_;
	}

	const std::string &log() const {
		return log_;
	}

private:
	Type type_;
	std::string name_;
	std::string log_;
};

/*!
	A @c Shader compiles and owns a single shader stage.
*/
class Shader {
public:
	enum class Stage {
		Vertex,
		Fragment,
	};

	/*!
		Compiles @c source as a @c stage shader.

		@param name Identifies the source in any error or log output.
		@throws ShaderError of type @c Compilation upon failure.
	*/
	Shader(const std::string &source, Stage stage, const std::string &name = "");
	~Shader();

	Shader(Shader &&);
	Shader &operator =(Shader &&);

	/*!
		Determines the stage of @c name from its extension, loads it via @c loader and compiles it.
	*/
	static Shader from_resource(const Storage::ResourceLoader &loader, const std::string &name);

	/// Maps `.vert` to @c Stage::Vertex and `.frag` to @c Stage::Fragment; @throws ShaderError otherwise.
	static Stage stage_for(const std::string &name);

	Stage stage() const {
		return stage_;
	}

	GLuint handle() const {
		return shader_;
	}

private:
	GLuint shader_ = 0;
	Stage stage_ = Stage::Vertex;
};

/*!
	A @c Program links and owns a complete pipeline built from individually-compiled @c Shader stages.
*/
class Program {
public:
	/*!
		Attaches all @c shaders, links and then detaches them again. The shaders may be
		destroyed as soon as construction is complete.

		@throws ShaderError of type @c Linkage upon failure.
	*/
	Program(const std::vector<Shader> &shaders, const std::string &name);
	~Program();

	Program(Program &&);
	Program &operator =(Program &&);

	/// Compiles `name.vert` and `name.frag`, in that order, and links them.
	static Program from_resources(const Storage::ResourceLoader &loader, const std::string &name);

	/*!
		Performs a @c glUseProgram to make this the active program unless
		it was the previous program bound and no calls have been received to unbind in the interim.
	*/
	void bind() const;

	/*!
		Unbinds the current instance of Program, if one is bound.
	*/
	static void unbind();

	/*!
		Performs a @c glGetAttribLocation call.
		@param name The name of the attribute to locate.
		@returns The location of the requested attribute, or -1 if it is not an active attribute.
	*/
	GLint get_attrib_location(const std::string &name) const;

	GLuint handle() const {
		return program_;
	}

private:
	GLuint program_ = 0;
};

}
