//
//  ErrorChain.cpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#include "ErrorChain.hpp"

#include "Log.hpp"

namespace {

void append_causes(std::vector<std::string> &chain, const std::exception &error) {
	chain.emplace_back(error.what());
	try {
		std::rethrow_if_nested(error);
	} catch(const std::exception &cause) {
		append_causes(chain, cause);
	} catch(...) {
		chain.emplace_back("unknown cause");
	}
}

}

std::vector<std::string> Log::cause_chain(const std::exception &error) {
	std::vector<std::string> chain;
	append_causes(chain, error);
	return chain;
}

void Log::print_cause_chain(FILE *const stream, const std::exception &error) {
	flush();

	bool is_first = true;
	for(const auto &message: cause_chain(error)) {
		if(is_first) {
			std::fprintf(stream, "%s\n", message.c_str());
		} else {
			std::fprintf(stream, "   Caused by: %s\n", message.c_str());
		}
		is_first = false;
	}
}
