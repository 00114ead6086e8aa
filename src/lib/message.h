//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-

#ifndef MESSAGE_H
#define MESSAGE_H

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "text.h"
#include "vastr.h"

namespace bifview {

int nwarnings ();
void incr_nwarnings();

// variadic-template functions for printing warnings and short messages
template<typename T, typename... Types>
void
warning (const T& first, const Types&... args) {
	std::ostringstream os;
	int indent{3};
	os << "Warning: " << first;
	os << vastr(args...);
	// format the string before printing
	std::string rval = roff(os.str(), indent, page_width()-indent);
	std::cout << rval << "\n\n";
	incr_nwarnings();
}

template<typename T, typename... Types>
void
info (const T& first, const Types&... args) {
// short messages to the user
	std::ostringstream os;
	os << first;
	os << vastr(args...);
	std::string rval = stringIndent(3, os.str());
	std::cout << rval << "\n\n";
	std::cout.flush();
}

} // namespace bifview

#endif // MESSAGE_H
