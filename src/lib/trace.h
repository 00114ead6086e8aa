//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-

// Trace support is enabled in the build with the BIFVIEW_TRACE
// cmake option, which defines TRACE

// Class Trace: support for trace printing when debug turned on; debug is
// turned on to level "n" by:
// 1) Settings::global("debug=n")
// 2) Trace::debug(n) in a program
// 3) DEBUG=n in the environment
// Printing is done mainly with Trace::dprint* functions when the trace
// level (set with the Trace constructor) is >= debug level.
// The indentation of nested traces is kept per thread so traced
// queries may run concurrently.
//
#ifndef TRACE_H
#define TRACE_H

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "vastr.h"

#ifdef TRACE
#  define T_(x) x
#else // NO TRACE
#  define T_(x)
#endif // TRACE

namespace bifview {

void incrementOffset();
void decrementOffset();
std::string DOffset();
void resetDOffset ();

class Trace {
private:
	std::string name;
	int Level;
	bool add_newline{true};

	static std::mutex& logmutex();
public:

	template<typename... Types>
	Trace(int lev, const std::string& fcn, const Types&... args) : Level(lev) {
		// Trace constructor: print Enter message, increment offset
		if (debug() >= Level) {
			name = fcn + vastr(args...);
			std::lock_guard<std::mutex> guard(logmutex());
			*logfile() << DOffset() << "Enter " << name << " {\n";
			incrementOffset();
		}
	}
	~Trace() {
		if (debug() >= Level) {
			decrementOffset();
			std::lock_guard<std::mutex> guard(logmutex());
			*logfile() << DOffset() << "Exit " << name << " }\n";
		}
	}
	Trace(const Trace&) = delete;
	Trace& operator=(const Trace&) = delete;

	// open a new logfile or return a pointer to the current one
	static std::ostream* logfile(const std::string& path="");

	// get/set global debug level; returns the previous level
	static int debug(int d=-1);

	bool operator()() const { return Level <= debug(); }

	template<typename T, typename... Types>
	void
	dprint(const T& firstArg, const Types&... args) {
	// debug print with trailing newline
		if (debug() < Level)
			return;
		std::lock_guard<std::mutex> guard(logmutex());
		std::ostream* lf = logfile();
		// set float format to default
		lf->unsetf(std::ios::floatfield);
		lf->precision(6);
		if (add_newline)
			*lf << DOffset();
		*lf << vastr(firstArg, args...);
		*lf << "\n";
		lf->flush();
		add_newline = true;
	}

	template<typename T, typename... Types>
	void
	dprintn(const T& firstArg, const Types&... args) {
	// debug print without trailing newline
		if (debug() < Level)
			return;
		std::lock_guard<std::mutex> guard(logmutex());
		std::ostream* lf = logfile();
		lf->unsetf(std::ios::floatfield);
		lf->precision(6);
		if (add_newline)
			*lf << DOffset();
		*lf << vastr(firstArg, args...);
		lf->flush();
		add_newline = false;
	}

	template<typename T, typename... Types>
	void
	dprintv (const std::vector<T>& a, const Types&... args) {
		if (debug() < Level)
			return;
		std::lock_guard<std::mutex> guard(logmutex());
		std::ostream* lf = logfile();
		*lf << DOffset();
		*lf << vastr(args...);
		if (a.empty()) {
			*lf << "  empty\n";
			return;
		}
		// print items ipl/line to keep line lengths < 80
		std::ostringstream os;
		os << a[0];
		int ipl = 80/(os.str().size()+2);
		if (ipl < 1) ipl = 1;
		*lf << "(" << a.size() << "): ";
		// if ipl>a.size put the vector on the same line as text
		if (ipl >= (int)a.size()) {
			for (auto& ai : a)
				*lf << "  " << ai;
		} else {
			for (size_t i=0; i<a.size(); i++) {
				if (i%ipl == 0) *lf << std::endl << DOffset();
				*lf << a[i];
				if (i != a.size()-1) *lf << ", ";
			}
		}
		*lf << std::endl;
	}

	template<typename T, typename U, typename... Types>
	void
	dprintvv (const std::vector<T>& a, const std::vector<U>& b,
			const Types&... args) {
		// print 2 vectors side-by-side
		if (debug() < Level)
			return;
		size_t n = a.size();
		if (b.size() != n) {
			throw std::runtime_error(vastr("dprintvv called with vectors of length ",
						n, " and ", b.size()));
		}
		std::lock_guard<std::mutex> guard(logmutex());
		std::ostream* lf = logfile();
		*lf << DOffset();
		*lf << vastr(args...);
		*lf << ": {\n";
		for (size_t i=0; i<n; i++) {
			*lf << DOffset() << "   " <<
				a[i] << "  " << b[i] << std::endl;
		}
		*lf << DOffset() << "}\n";
	}

	// return the name of the function being Trace'd
	std::string fcnname() const { return name; }
};  // class Trace

} // namespace bifview

#endif  // TRACE_H
