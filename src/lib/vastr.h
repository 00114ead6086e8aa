//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-

#ifndef VASTR_H
#define VASTR_H 1

// variadic template function to build a string from an arbitrary
// number of arguments of any type that has operator<<

#include <sstream>
#include <string>
#include <vector>

namespace bifview {

// operator<< for vector<T> for any type T that has operator<<
// short vectors get printed on one line, long ones are broken
// into lines of about 80 characters
template<typename Type>
std::ostream&
operator<<(std::ostream& s, const std::vector<Type>& x) {
	size_t maxlen{80};
	std::ostringstream os;
	if (x.empty())
		return s;
	os.precision(s.precision());
	std::vector<std::string> items;
	for (auto& xi : x) {
		os.str("");
		os << xi;
		items.push_back(os.str());
	}
	// create lines of length < maxlen
	std::vector<std::string> lines;
	size_t i{0};
	while (i < items.size()) {
		os.str("");
		std::string sep;
		for (size_t j=i; j<items.size(); j++) {
			os << sep << items[j];
			i++;
			sep = ", ";
			if (os.str().size() > maxlen)
				break;
		}
		lines.push_back(os.str());
	}
	if (lines.size() > 1) {
		s << " {\n";
		for (auto& li : lines)
			s << li << std::endl;
		s << "}";
	} else
		s << lines[0];
	return s;
}

std::string
vastr();  // final vastr (no arguments), implemented in vastr.cpp

template<typename T, typename... Types>
std::string
vastr(const T& firstArg, const Types&... args) {
	std::ostringstream os;
	os << firstArg;
	os << vastr(args...);
	return os.str();
}

} // namespace bifview

#endif // VASTR_H
