//
//  ErrorChainTests.cpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#include <catch2/catch.hpp>

#include "Outputs/ErrorChain.hpp"
#include "Outputs/Log.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>

TEST_CASE("Cause chains run outermost first", "[errors]") {
	try {
		try {
			throw std::runtime_error("root cause");
		} catch(const std::exception &) {
			std::throw_with_nested(std::logic_error("context"));
		}
	} catch(const std::exception &error) {
		const auto chain = Log::cause_chain(error);
		REQUIRE(chain.size() == 2);
		REQUIRE(chain[0] == "context");
		REQUIRE(chain[1] == "root cause");
	}
}

TEST_CASE("Unnested errors are a chain of one", "[errors]") {
	const std::runtime_error error("alone");
	const auto chain = Log::cause_chain(error);
	REQUIRE(chain.size() == 1);
	REQUIRE(chain[0] == "alone");
}

namespace {

std::string contents(FILE *const stream) {
	std::rewind(stream);
	std::string printed;
	int c;
	while((c = std::fgetc(stream)) != EOF) printed.push_back(char(c));
	return printed;
}

}

TEST_CASE("Printed chains introduce each cause", "[errors]") {
	try {
		try {
			throw std::runtime_error("root cause");
		} catch(const std::exception &) {
			std::throw_with_nested(std::runtime_error("middle"));
		}
	} catch(const std::exception &) {
		try {
			std::throw_with_nested(std::runtime_error("outermost"));
		} catch(const std::exception &error) {
			FILE *const stream = std::tmpfile();
			REQUIRE(stream);
			Log::print_cause_chain(stream, error);

			const auto printed = contents(stream);
			std::fclose(stream);

			REQUIRE(printed == "outermost\n   Caused by: middle\n   Caused by: root cause\n");
		}
	}
}

TEST_CASE("Held back log lines precede a printed chain", "[errors][log]") {
	FILE *const stream = std::tmpfile();
	REQUIRE(stream);

	Log::LogLine<Log::Source::Shader, true>(stream).append("Compiling %s", "triangle.frag");
	REQUIRE(Log::AccumulatingLog::accumulator_.count == 1);
	REQUIRE(contents(stream).empty());

	Log::print_cause_chain(stream, std::runtime_error("Failed to compile shader triangle.frag"));
	REQUIRE(Log::AccumulatingLog::accumulator_.count == 0);

	const auto printed = contents(stream);
	std::fclose(stream);
	REQUIRE(printed == "[Shader] Compiling triangle.frag\nFailed to compile shader triangle.frag\n");
}
