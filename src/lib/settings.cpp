//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-

// class Settings: a collection of named settings of any type

#include <any>
#include <boost/core/demangle.hpp>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <vector>

#include "message.h"
#include "settings.h"
#include "text.h"
#include "trace.h"

using namespace std;

namespace bifview {

// settings are kept in a map of string keys and std::any data;
// note that std::any requires C++17

Settings Settings::defaults{Settings::analysis_defaults()};

Settings
Settings::
analysis_defaults() {
	Settings rval;
	// tolerance for "near zero real part" and "near the unit circle"
	rval.the_map["stability_tol"] = 1.0e-6;
	// tolerance for reporting a Floquet multiplier as the trivial one
	rval.the_map["trivial_tol"] = 1.0e-2;
	// collocation mesh when a limit cycle branch carries none
	rval.the_map["ntst"] = 20;
	rval.the_map["ncol"] = 4;
	// points per page in the point browser
	rval.the_map["page_size"] = 10;
	return rval;
}

bool
Settings::
is_defined(const string& name) const {
	return the_map.find(name) != the_map.end();
}

bool
Settings::
remove(const string& name) {
// delete a setting, return true if successful,
// false if the setting does not exist
	auto pos = the_map.find(name);
	if (pos != the_map.end()) {
		the_map.erase(pos);
		return true;
	}
	return false;
}

static bool
is_double(const std::any& t) {
	return t.type() == typeid(double);
}

string
Settings::
datatype(const string& name) const {
	auto pos = the_map.find(name);
	if (pos == the_map.end())
		return "undefined";
	const std::any& t = pos->second;
	if (t.type() == typeid(bool))
		return "bool";
	if (t.type() == typeid(int))
		return "int";
	if (t.type() == typeid(double))
		return "double";
	if (t.type() == typeid(string))
		return "string";
	return boost::core::demangle(t.type().name());
}

std::ostream&
operator<<(std::ostream& s, const Settings& t) {
	for (auto& ti : t.the_map)
		s << ti.first << " = " << ti.second << endl;
	return s;
}

std::ostream&
operator<<(std::ostream& s, const std::any& t) {
	if (t.type() == typeid(bool))
		s << boolalpha << std::any_cast<bool>(t);
	else if (t.type() == typeid(string))
		s << std::any_cast<string>(t);
	else if (t.type() == typeid(double))
		s << std::any_cast<double>(t);
	else if (t.type() == typeid(int))
		s << std::any_cast<int>(t);
	else if (t.type() == typeid(vector<int>))
		s << std::any_cast<vector<int>>(t);
	else if (t.type() == typeid(vector<double>))
		s << std::any_cast<vector<double>>(t);
	else
		s << "(" << boost::core::demangle(t.type().name()) << ")";
	return s;
}

/*--------------------------------------------------------------------
 * Settings::global(string& pref):  set various global settings
 * Valid options:
 *    d(ebug)=n        trace level (0, 1, 2, or 3)
 *    page[_]width=n   max width for subsequent printout
 *    logfile=path     write trace output to "path" instead of stderr
 *    name=value       any other setting, stored in Settings::defaults
 *                     as an int, double, bool (true/false) or string
 *    name             same as name=true
 * Options are separated by commas.
 *------------------------------------------------------------------*/
bool
Settings::
global (string const& preferences) {
	T_(Trace trc(1,"global");)
	T_(trc.dprint("preferences: ",preferences);)

	for (auto& opt : string2tok(preferences, ",")) {
		string lhs;
		string rhs;
		string::size_type eq = opt.find('=');
		if (eq == string::npos) {
			lhs = opt;
		} else {
			lhs = stripwhitespace(opt.substr(0, eq));
			rhs = stripwhitespace(opt.substr(eq+1));
		}
		T_(trc.dprint("got <",lhs,"> = <",rhs,">");)
		if (lhs.empty())
			throw runtime_error(vastr("preference with no name: \"",opt,"\""));

		// strip quotes from the rhs
		if (rhs.size() > 1 && (rhs[0] == '"' || rhs[0] == '\'') && rhs.back() == rhs[0])
			rhs = rhs.substr(1, rhs.size()-2);

		string name = stringLower(lhs);
		if (name == "d" || name == "debug") {
			int lvl{0};
			if (!str2int(rhs, lvl))
				throw runtime_error(vastr("the debug preference must be an integer: ",opt));
			if (lvl < 0) lvl = 0;
			if (lvl > 0) info("Debug has been set to ",lvl);
			Trace::debug(lvl);
		} else if (name == "pagewidth" || name == "page_width") {
			int pw{0};
			if (!str2int(rhs, pw) || pw < 10) {
				warning("page width must be a positive integer: ", opt);
			} else {
				page_width(pw);
			}
		} else if (name == "logfile") {
			if (rhs.empty())
				throw runtime_error("no rhs with the logfile preference");
			Trace::logfile(rhs);
		} else if (rhs.empty()) {
			Settings::defaults.set(lhs, true);
		} else {
			int ival;
			double dval;
			auto pos = defaults.the_map.find(lhs);
			bool was_double = (pos != defaults.the_map.end() && is_double(pos->second));
			// keep a double setting a double even if given as an integer
			if (!was_double && str2int(rhs, ival))
				Settings::defaults.set(lhs, ival);
			else if (str2double(rhs, dval))
				Settings::defaults.set(lhs, dval);
			else if (rhs == "true")
				Settings::defaults.set(lhs, true);
			else if (rhs == "false")
				Settings::defaults.set(lhs, false);
			else
				Settings::defaults.set(lhs, rhs);
		}
	}
	return true;
}

std::string
Settings::
toString() const {
// write all defined settings to a string
	ostringstream os;
	os << *this;
	return os.str();
}

} // namespace bifview
