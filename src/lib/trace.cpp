//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-

/*------------------------------------------------------------------
 * trace: routines for debug tracing
 *------------------------------------------------------------------*/
#include <atomic>

#include "message.h"
#include "text.h"
#include "trace.h"

using namespace std;

namespace bifview {

static int
initial_level() {
// the debug level a process starts with: DEBUG in the environment
	int rval{0};
	string env = getEnv("DEBUG");
	if (!env.empty() && !str2int(env, rval)) {
		warning("DEBUG environment variable is not an integer (",env,")");
		rval = 0;
	}
	return rval < 0 ? 0 : rval;
}

int
Trace::
debug(int d) {
// set/get the global debug level
	static atomic<int> thelevel{initial_level()};
	if (d >= 0)
		return thelevel.exchange(d);
	return thelevel.load();
}

mutex&
Trace::
logmutex() {
	static mutex themutex;
	return themutex;
}

ostream*
Trace::
logfile(const string& path) {
// open a new logfile or return a pointer to the current one
	static unique_ptr<ofstream> owned;
	static ostream* thestream{&cerr};
	if (!path.empty()) {
		unique_ptr<ofstream> file(new ofstream(path));
		if (!*file)
			throw runtime_error(vastr("cannot open trace logfile \"",path,"\""));
		lock_guard<mutex> guard(logmutex());
		thestream = file.get();
		owned = std::move(file);
	}
	return thestream;
}

// nesting level of the Trace's in the current thread
static thread_local int Offlvl = 0;

void
incrementOffset() {
	Offlvl++;
}

void
decrementOffset() {
	Offlvl--;
	if (Offlvl < 0)
		Offlvl = 0;
}

void
resetDOffset () {
	Offlvl = 0;
}

string
DOffset() {
	return string(Offlvl, ' ');
}

} // namespace bifview
