//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-

// text: string utilities for formatting messages and
// parsing preference strings

#ifndef TEXT_H
#define TEXT_H

#include <string>
#include <vector>

namespace bifview {

// value of an environment variable, empty if it is not set
std::string getEnv (std::string const& var);

std::string stringLower (std::string const& a);

// strip leading and trailing blanks, tabs, and newlines
std::string stripwhitespace (std::string const& s);

// split a string into tokens separated by any of the characters
// in "delim"; whitespace around each token is removed
std::vector<std::string> string2tok (std::string const& str, std::string const& delim);

// indent a (possibly multi-line) string by nchar blanks
std::string stringIndent (size_t nchar, std::string const& s);

// indent each line of "s" and break lines longer than linelen
std::string roff (std::string const& s, unsigned int indent, unsigned int linelen);

// get/set the width of printed output; returns the previous width
int page_width(int newpw=0);

// convert a whole string to int or double; return false and leave
// x unchanged if the string does not represent a number
bool str2int (std::string const& s, int& x);
bool str2double (std::string const& s, double& x);

} // namespace bifview

#endif // TEXT_H
