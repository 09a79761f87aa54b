//
//  ResourcesTests.cpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#include <catch2/catch.hpp>

#include "TemporaryDirectory.hpp"

#include "Storage/Resources.hpp"

#include <cerrno>
#include <string>
#include <system_error>

using namespace std::string_literals;

TEST_CASE("Names map to paths beneath the root", "[resources]") {
	const Storage::FileResources resources("/opt/assets/");
	REQUIRE(resources.root() == "/opt/assets");
	REQUIRE(resources.path_for("shaders/triangle.vert") == "/opt/assets/shaders/triangle.vert");
	REQUIRE(resources.path_for("/shaders//triangle.frag") == "/opt/assets/shaders/triangle.frag");
	REQUIRE(resources.path_for("readme") == "/opt/assets/readme");
}

TEST_CASE("Resources load as bytes and as text", "[resources]") {
	TemporaryDirectory directory;
	directory.make_directory("shaders");
	directory.write("shaders/triangle.vert", "#version 330 core\nvoid main() {}\n");

	const Storage::FileResources resources(directory.path());

	const auto bytes = resources.load("shaders/triangle.vert");
	REQUIRE(bytes.size() == 33);
	REQUIRE(bytes.front() == '#');

	const auto text = resources.load_text("shaders/triangle.vert");
	REQUIRE(text == "#version 330 core\nvoid main() {}\n");
}

TEST_CASE("Empty resources are not an error", "[resources]") {
	TemporaryDirectory directory;
	directory.write("empty", "");

	const Storage::FileResources resources(directory.path());
	REQUIRE(resources.load("empty").empty());
	REQUIRE(resources.load_text("empty").empty());
}

TEST_CASE("Missing resources report an IO error with its cause", "[resources]") {
	TemporaryDirectory directory;
	const Storage::FileResources resources(directory.path());

	try {
		resources.load("shaders/absent.vert");
		FAIL("Expected a ResourceError");
	} catch(const Storage::ResourceError &error) {
		REQUIRE(error.type() == Storage::ResourceError::Type::IO);
		REQUIRE(error.name() == "shaders/absent.vert");
		REQUIRE_THROWS_AS(std::rethrow_if_nested(error), std::system_error);

		try {
			std::rethrow_if_nested(error);
		} catch(const std::system_error &cause) {
			REQUIRE(cause.code().value() == ENOENT);
		}
	}
}

TEST_CASE("Directories are not resources", "[resources]") {
	TemporaryDirectory directory;
	directory.make_directory("shaders");
	const Storage::FileResources resources(directory.path());

	try {
		resources.load("shaders");
		FAIL("Expected a ResourceError");
	} catch(const Storage::ResourceError &error) {
		REQUIRE(error.type() == Storage::ResourceError::Type::IO);
	}
}

TEST_CASE("Text with an embedded NUL is rejected", "[resources]") {
	TemporaryDirectory directory;
	directory.write("broken.frag", "void main()\0{}"s);

	const Storage::FileResources resources(directory.path());
	REQUIRE(resources.load("broken.frag").size() == 14);

	try {
		resources.load_text("broken.frag");
		FAIL("Expected a ResourceError");
	} catch(const Storage::ResourceError &error) {
		REQUIRE(error.type() == Storage::ResourceError::Type::ContainsNul);
		REQUIRE(error.name() == "broken.frag");
		REQUIRE(std::string(error.what()).find("broken.frag") != std::string::npos);
	}
}

TEST_CASE("Executable-relative roots sit beside the running binary", "[resources]") {
	const auto resources = Storage::FileResources::relative_to_executable("assets");
	const auto &root = resources.root();

	REQUIRE(root.front() == '/');
	REQUIRE(root.size() > 7);
	REQUIRE(root.substr(root.size() - 7) == "/assets");
}
