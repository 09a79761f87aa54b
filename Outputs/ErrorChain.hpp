//
//  ErrorChain.hpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#pragma once

#include <cstdio>
#include <exception>
#include <string>
#include <vector>

namespace Log {

/*!
	Walks the chain of exceptions nested via @c std::throw_with_nested.

	@returns The message of @c error followed by the message of each nested cause,
		i.e. outermost context first and the root cause last.
*/
std::vector<std::string> cause_chain(const std::exception &error);

/*!
	Prints @c cause_chain(error) to @c stream; the first entry is printed as-is and each
	subsequent entry is introduced as the cause of the one above it. Log lines held back on
	this thread are printed first.
*/
void print_cause_chain(FILE *stream, const std::exception &error);

}
