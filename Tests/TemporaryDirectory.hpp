//
//  TemporaryDirectory.hpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#pragma once

#include <sys/stat.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

/// Creates a scratch directory beneath /tmp and removes everything written through it upon destruction.
class TemporaryDirectory {
public:
	TemporaryDirectory() {
		char name[] = "/tmp/trichrome-XXXXXX";
		if(!mkdtemp(name)) {
			throw std::runtime_error("Could not create a temporary directory");
		}
		path_ = name;
	}

	~TemporaryDirectory() {
		for(auto file = files_.rbegin(); file != files_.rend(); ++file) {
			std::remove(file->c_str());
		}
		for(auto directory = directories_.rbegin(); directory != directories_.rend(); ++directory) {
			rmdir(directory->c_str());
		}
		rmdir(path_.c_str());
	}

	const std::string &path() const {
		return path_;
	}

	void make_directory(const std::string &name) {
		const auto full_path = path_ + "/" + name;
		if(mkdir(full_path.c_str(), 0700)) {
			throw std::runtime_error("Could not create " + full_path);
		}
		directories_.push_back(full_path);
	}

	void write(const std::string &name, const std::string &contents) {
		const auto full_path = path_ + "/" + name;
		FILE *const file = std::fopen(full_path.c_str(), "wb");
		if(!file) {
			throw std::runtime_error("Could not create " + full_path);
		}
		std::fwrite(contents.data(), 1, contents.size(), file);
		std::fclose(file);
		files_.push_back(full_path);
	}

private:
	std::string path_;
	std::vector<std::string> files_;
	std::vector<std::string> directories_;
};
