//
//  Shader.cpp
//  Trichrome
//
//  Created by Thomas Harte on 07/02/2016.
//  Copyright 2016 Thomas Harte. All rights reserved.
//

#include "Shader.hpp"

#include "Outputs/Log.hpp"

#include <exception>
#include <utility>

using namespace Outputs::Display::OpenGL;

namespace {
thread_local const Program *bound_program = nullptr;
using Logger = Log::Logger<Log::Source::Shader>;

std::string message(const ShaderError::Type type, const std::string &name, const std::string &log) {
	switch(type) {
		case ShaderError::Type::ResourceLoad:
			return "Failed to load shader resource " + name;
		case ShaderError::Type::UnknownStage:
			return "Cannot determine shader stage for resource " + name;
		case ShaderError::Type::Compilation:
			return "Failed to compile shader " + name + ": " + log;
		case ShaderError::Type::Linkage:
			return "Failed to link program " + name + ": " + log;
	}
	return "Shader error";
}

constexpr GLenum gl_stage(const Shader::Stage stage) {
	switch(stage) {
		default:
		case Shader::Stage::Vertex:		return GL_VERTEX_SHADER;
		case Shader::Stage::Fragment:	return GL_FRAGMENT_SHADER;
	}
}

bool ends_with(const std::string &name, const std::string &suffix) {
	return name.size() >= suffix.size() && !name.compare(name.size() - suffix.size(), suffix.size(), suffix);
}

std::string shader_log(const GLuint shader) {
	GLint length = 0;
	test_gl(glGetShaderiv, shader, GL_INFO_LOG_LENGTH, &length);
	if(length <= 0) return "";

	std::string log(size_t(length), '\0');
	test_gl(glGetShaderInfoLog, shader, length, &length, log.data());
	log.resize(size_t(length));
	return log;
}

std::string program_log(const GLuint program) {
	GLint length = 0;
	test_gl(glGetProgramiv, program, GL_INFO_LOG_LENGTH, &length);
	if(length <= 0) return "";

	std::string log(size_t(length), '\0');
	test_gl(glGetProgramInfoLog, program, length, &length, log.data());
	log.resize(size_t(length));
	return log;
}
}

ShaderError::ShaderError(const Type type, const std::string &name, const std::string &log) :
	std::runtime_error(message(type, name, log)), type_(type), name_(name), log_(log) {}

// MARK: - Shader

Shader::Shader(const std::string &source, const Stage stage, const std::string &name) : stage_(stage) {
	shader_ = glCreateShader(gl_stage(stage));
	const char *c_str = source.c_str();
	test_gl(glShaderSource, shader_, 1, &c_str, NULL);
	test_gl(glCompileShader, shader_);

	GLint is_compiled = GL_FALSE;
	test_gl(glGetShaderiv, shader_, GL_COMPILE_STATUS, &is_compiled);
	if(is_compiled == GL_FALSE) {
		const auto log = shader_log(shader_);
		Logger::error().append("Compile log for %s: %s", name.c_str(), log.c_str());

		glDeleteShader(shader_);
		shader_ = 0;
		throw ShaderError(ShaderError::Type::Compilation, name, log);
	}

	Logger::info().append("Compiled %s", name.c_str());
}

Shader::~Shader() {
	if(shader_) {
		glDeleteShader(shader_);
	}
}

Shader::Shader(Shader &&rhs) {
	*this = std::move(rhs);
}

Shader &Shader::operator =(Shader &&rhs) {
	std::swap(shader_, rhs.shader_);
	std::swap(stage_, rhs.stage_);
	return *this;
}

Shader::Stage Shader::stage_for(const std::string &name) {
	if(ends_with(name, ".vert")) return Stage::Vertex;
	if(ends_with(name, ".frag")) return Stage::Fragment;
	throw ShaderError(ShaderError::Type::UnknownStage, name);
}

Shader Shader::from_resource(const Storage::ResourceLoader &loader, const std::string &name) {
	const auto stage = stage_for(name);

	std::string source;
	try {
		source = loader.load_text(name);
	} catch(const Storage::ResourceError &) {
		std::throw_with_nested(ShaderError(ShaderError::Type::ResourceLoad, name));
	}

	return Shader(source, stage, name);
}

// MARK: - Program

Program::Program(const std::vector<Shader> &shaders, const std::string &name) {
	program_ = glCreateProgram();
	for(const auto &shader: shaders) {
		test_gl(glAttachShader, program_, shader.handle());
	}

	test_gl(glLinkProgram, program_);

	const auto log = program_log(program_);
	GLint did_link = GL_FALSE;
	test_gl(glGetProgramiv, program_, GL_LINK_STATUS, &did_link);
	if(did_link == GL_FALSE) {
		Logger::error().append("Link log for %s: %s", name.c_str(), log.c_str());

		glDeleteProgram(program_);
		program_ = 0;
		throw ShaderError(ShaderError::Type::Linkage, name, log);
	}
	Logger::info().append_if(!log.empty(), "Link log for %s: %s", name.c_str(), log.c_str());

	for(const auto &shader: shaders) {
		test_gl(glDetachShader, program_, shader.handle());
	}
}

Program::~Program() {
	if(bound_program == this) Program::unbind();
	if(program_) {
		glDeleteProgram(program_);
	}
}

Program::Program(Program &&rhs) {
	*this = std::move(rhs);
}

Program &Program::operator =(Program &&rhs) {
	std::swap(program_, rhs.program_);
	if(bound_program == &rhs) {
		bound_program = this;
	} else if(bound_program == this) {
		bound_program = &rhs;
	}
	return *this;
}

Program Program::from_resources(const Storage::ResourceLoader &loader, const std::string &name) {
	std::vector<Shader> shaders;
	shaders.push_back(Shader::from_resource(loader, name + ".vert"));
	shaders.push_back(Shader::from_resource(loader, name + ".frag"));
	return Program(shaders, name);
}

void Program::bind() const {
	if(bound_program != this) {
		test_gl(glUseProgram, program_);
		bound_program = this;
	}
}

void Program::unbind() {
	bound_program = nullptr;
	test_gl(glUseProgram, 0);
}

GLint Program::get_attrib_location(const std::string &name) const {
	return glGetAttribLocation(program_, name.c_str());
}
