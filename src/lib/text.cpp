//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <regex>
#include <sstream>

#include "message.h"
#include "text.h"

using namespace std;

namespace bifview {

string
getEnv (string const& var) {
/*
 * get the value of environment variable "var"
 * if it exists; otherwise an empty string
 * is returned. This avoids the problem of initializing
 * a string from getenv() if it returns a null pointer.
 */
	char const* val = getenv(var.c_str());
	if (val != nullptr)
		return string(val);
	return string();
}

string
stringLower(string const& a) {
	string rval(a);
	for (size_t i=0; i<rval.size(); i++)
		rval[i] = tolower(rval[i]);
	return rval;
}

string
stripwhitespace(string const& s) {
// Strip leading and trailing whitespace from a string
	string rval;
	string::size_type first = s.find_first_not_of(" \t\n");
	if (first == string::npos)
		return rval;
	string::size_type last = s.find_last_not_of(" \t\n");
	return s.substr(first, last-first+1);
}

vector<string>
string2tok (string const& str, string const& delim) {
	vector<string> rval;
	string::size_type first = 0;
	while (first < str.size()) {
		string::size_type last = str.find_first_of(delim, first);
		if (last == string::npos)
			last = str.size();
		string tok = stripwhitespace(str.substr(first, last-first));
		if (!tok.empty())
			rval.push_back(tok);
		first = last + 1;
	}
	return rval;
}

string
stringIndent (size_t nchar, const string& s) {
	string rval;
	string indent(nchar, ' ');
	if (s.empty())
		return rval;
	if (s[0] != '\n')
		rval = indent;
	for (size_t i=0; i<s.size(); i++) {
		rval += s[i];
		if (s[i] == '\n' && i != s.size()-1)
			rval += indent;
	}
	return rval;
}

string
roff (string const& s, unsigned int indent, unsigned int linelen) {
// do some simple formatting of a string:
//   - indent it by "indent" char
//   - restrict lines to no more than "linelen" char
	if (s.empty())
		return s;

	ostringstream os;
	string ind(indent, ' ');
	string::size_type start = 0;
	string::size_type idx = 0;
	// break the string into lines, then format each line
	do {
		string theline;
		idx = s.find('\n', start);
		if (idx == string::npos)
			theline = s.substr(start);
		else {
			theline = s.substr(start, idx-start);
			start = idx+1;
		}

		// break the line up into blank-separated words
		vector<string> tok = string2tok(theline, " \t");
		string line;
		for (auto& ti : tok) {
			if (!line.empty() && line.size() + ti.size() + 1 >= linelen) {
				os << ind << line << "\n";
				line.clear();
			} else if (!line.empty()) {
				line += ' ';
			}
			line += ti;
		}
		if (!line.empty())
			os << ind << line;
		if (idx != string::npos)
			os << "\n";
	} while (idx != string::npos && start < s.size());
	return os.str();
}

int
page_width(int newpw) {
// Returns the current desired width of text going to output.
// The pagewidth can be set either by setting environment variable
// PAGEWIDTH or calling this function with an integer argument, e.g.
//     page_width(120);
	static atomic<int> pagewidth{0};
	int defaultpw{160};

	// check environment
	if (pagewidth == 0) {
		int pw{defaultpw};
		string env = getEnv("PAGEWIDTH");
		if (!env.empty()) {
			if (!str2int(env, pw) || pw < 10 || pw > 10000) {
				warning("illegal pagewidth specified with PAGEWIDTH "
					"environment variable (",env,")");
				pw = defaultpw;
			}
		}
		int unset{0};
		pagewidth.compare_exchange_strong(unset, pw);
	}

	if (newpw > 0)
		return pagewidth.exchange(newpw);
	return pagewidth.load();
}

bool
str2int(const string& s, int& x) {
// convert a string to int; false if s is not an integer
	static const regex re("^[ \t]*[+-]?[0-9]+[ \t]*$");
	if (!regex_match(s, re))
		return false;
	try {
		x = std::stoi(s);
	} catch (std::out_of_range& e) {
		return false;
	}
	return true;
}

bool
str2double(const string& s, double& x) {
// convert a string (s) to a double (x), return true if the conversion was
// successful, false if the string does not represent a double and x is unchanged.
// Fortran-style exponents (1.0d-3) are accepted
	static const regex re("^[ \t]*[+-]?([0-9]+[.]?[0-9]*|[0-9]*[.]?[0-9]+)"
			"([dDeE][+-]?[0-9]+)?[ \t\n]*$");
	if (!regex_match(s, re))
		return false;
	string t{s};
	for (auto& c : t)
		if (c == 'd' || c == 'D')
			c = 'e';
	try {
		x = std::stod(t);
	} catch (std::out_of_range& e) {
		return false;
	}
	return true;
}

} // namespace bifview
