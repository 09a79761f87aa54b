//
//  Resources.hpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace Storage {

class ResourceError: public std::runtime_error {
public:
	enum class Type {
		/// The resource could not be opened or read; the cause is nested as a @c std::system_error.
		IO,
		/// The resource was requested as text but contains a NUL byte.
		ContainsNul,
		/// The path of the running executable could not be determined.
		NoExecutablePath,
	};

	ResourceError(Type type, const std::string &name);

	Type type() const {
		return type_;
	}

	const std::string &name() const {
		return name_;
	}

private:
	Type type_;
	std::string name_;
};

/*!
	Maps forward-slash-delimited logical names to byte contents.
*/
class ResourceLoader {
public:
	virtual ~ResourceLoader() = default;

	/// @returns The complete contents of the resource @c name. @throws ResourceError upon failure.
	virtual std::vector<uint8_t> load(const std::string &name) const = 0;

	/*!
		Loads @c name as text suitable for handing to C APIs.

		@throws ResourceError of type @c ContainsNul if the resource has an embedded NUL byte.
	*/
	std::string load_text(const std::string &name) const;
};

/*!
	Loads resources from files beneath a root directory.
*/
class FileResources: public ResourceLoader {
public:
	explicit FileResources(const std::string &root);

	/*!
		Builds a loader rooted at @c subdirectory of the directory that holds the running executable.

		@throws ResourceError of type @c NoExecutablePath if the executable cannot be located.
	*/
	static FileResources relative_to_executable(const std::string &subdirectory);

	std::vector<uint8_t> load(const std::string &name) const override;

	/// @returns The file-system path that @c name maps to.
	std::string path_for(const std::string &name) const;

	const std::string &root() const {
		return root_;
	}

private:
	std::string root_;
};

}
