//
//  Resources.cpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#include "Resources.hpp"

#include "Outputs/Log.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <memory>
#include <system_error>

using namespace Storage;

namespace {
using Logger = Log::Logger<Log::Source::Resources>;

std::string message(const ResourceError::Type type, const std::string &name) {
	switch(type) {
		case ResourceError::Type::IO:
			return "Failed to read resource " + name;
		case ResourceError::Type::ContainsNul:
			return "Resource " + name + " contains a NUL byte and cannot be used as text";
		case ResourceError::Type::NoExecutablePath:
			return "Failed to determine the path of the running executable";
	}
	return "Resource error";
}

[[noreturn]] void throw_io_error(const std::string &name, const std::string &path) {
	const std::system_error cause(errno, std::generic_category(), path);
	try {
		throw cause;
	} catch(const std::system_error &) {
		std::throw_with_nested(ResourceError(ResourceError::Type::IO, name));
	}
}

struct FileCloser {
	void operator()(FILE *const file) const {
		std::fclose(file);
	}
};
using File = std::unique_ptr<FILE, FileCloser>;
}

ResourceError::ResourceError(const Type type, const std::string &name) :
	std::runtime_error(message(type, name)), type_(type), name_(name) {}

std::string ResourceLoader::load_text(const std::string &name) const {
	const auto contents = load(name);
	if(std::find(contents.begin(), contents.end(), 0) != contents.end()) {
		throw ResourceError(ResourceError::Type::ContainsNul, name);
	}
	return std::string(contents.begin(), contents.end());
}

FileResources::FileResources(const std::string &root) : root_(root) {
	while(root_.size() > 1 && root_.back() == '/') {
		root_.pop_back();
	}
}

FileResources FileResources::relative_to_executable(const std::string &subdirectory) {
	std::vector<char> path(256);
	while(true) {
		const auto length = readlink("/proc/self/exe", path.data(), path.size());
		if(length < 0) {
			throw ResourceError(ResourceError::Type::NoExecutablePath, subdirectory);
		}
		if(size_t(length) < path.size()) {
			path.resize(size_t(length));
			break;
		}
		path.resize(path.size() * 2);
	}

	std::string directory(path.begin(), path.end());
	const auto slash = directory.find_last_of('/');
	if(slash == std::string::npos) {
		throw ResourceError(ResourceError::Type::NoExecutablePath, subdirectory);
	}
	directory.resize(slash);

	Logger::info().append("Executable directory is %s", directory.c_str());
	return FileResources(directory + "/" + subdirectory);
}

std::string FileResources::path_for(const std::string &name) const {
	std::string path = root_;

	size_t start = 0;
	while(start <= name.size()) {
		const auto end = std::min(name.find('/', start), name.size());
		if(end > start) {
			path += '/';
			path.append(name, start, end - start);
		}
		start = end + 1;
	}

	return path;
}

std::vector<uint8_t> FileResources::load(const std::string &name) const {
	const auto path = path_for(name);

	struct stat file_stats;
	if(stat(path.c_str(), &file_stats)) {
		throw_io_error(name, path);
	}
	if(!S_ISREG(file_stats.st_mode)) {
		errno = EISDIR;
		throw_io_error(name, path);
	}

	File file(std::fopen(path.c_str(), "rb"));
	if(!file) {
		throw_io_error(name, path);
	}

	std::vector<uint8_t> contents(size_t(file_stats.st_size));
	contents.resize(std::fread(contents.data(), 1, contents.size(), file.get()));
	if(std::ferror(file.get())) {
		throw_io_error(name, path);
	}

	Logger::info().append("Loaded %s (%zu bytes)", path.c_str(), contents.size());
	return contents;
}
