//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
#ifndef SETTINGS_H
#define SETTINGS_H
/*
 * Settings that control the analysis functions: tolerances, default
 * collocation mesh, and presentation options. Settings are created
 * from user-supplied preferences (Settings::global) and from within
 * programs at run time.
 * Settings::defaults may be read concurrently but must not be
 * changed while queries are running in other threads.
 */

#include <any>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "message.h"

namespace bifview {

class Settings {

private:
	std::map<std::string, std::any> the_map;

	// the pre-defined analysis settings
	static Settings analysis_defaults();

public:
	Settings() = default;

	// default settings are accessed like this:
	//   Settings::defaults.get(...)
	static Settings defaults;

	// return (string) datatype of setting "name"
	std::string datatype(const std::string& name) const;

	// is setting "name" defined?
	bool is_defined(const std::string& name) const;
	// remove a setting
	bool remove(const std::string& name);

	// write all settings to a string
	std::string toString() const;

	// to get a setting value call this with the return
	// value as the second argument
	// Returns: true if the setting is defined; t is set to the value
	//          false if it is not defined; t is unchanged
	// Throws runtime_error if called with T the wrong datatype
	template<typename T> bool
	get(const std::string& name, T& t) const {
		if (!this->is_defined(name))
			return false;

		try {
			t = std::any_cast<T>(the_map.at(name));
		} catch(std::bad_any_cast& s) {
			throw std::runtime_error(vastr("attempting to get the value of setting (",
					name,"): wrong datatype"));
		}
		return true;
	}

	// create or change the value of setting "name" to "t"
	// Returns the previous value, or T{} if it was not defined
	template<typename T> T
	set(const std::string& name, const T& t) {
		T rval{};
		// get existing value: throws if the type changes
		try {
			get(name,rval);
		} catch(std::runtime_error& s) {
			warning("changing the datatype of ",name);
		}

		the_map[name] = t;
		return rval;
	}

	// parse a preference string, e.g. "debug=2, stability_tol=1e-8, ntst=40"
	// and apply it to the process (trace level, page width) and
	// to Settings::defaults
	static bool global (const std::string& preferences);

	friend std::ostream& operator<<(std::ostream& s, const Settings& t);

}; // class Settings

std::ostream&
operator<<(std::ostream& s, const std::any& t);

} // namespace bifview

#endif  // SETTINGS_H
