//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-

#include <algorithm>
#include <cmath>

#include "fptype.h"
#include "metrics.h"
#include "trace.h"

using namespace std;

namespace bifview {

std::ostream&
operator<<(std::ostream& s, const VariableMetrics& t) {
	s << "min " << t.min << ", max " << t.max << ", range " << t.range
		<< ", mean " << t.mean << ", rms " << t.rms;
	return s;
}

CycleMetrics
cycle_metrics(const vector<vector<double>>& profile, double period) {
	T_(Trace trc(2,"cycle_metrics");)
	CycleMetrics rval{{}, period};
	if (profile.empty())
		return rval;

	size_t dim = profile[0].size();
	for (auto& pi : profile) {
		if (pi.size() != dim) {
			T_(trc.dprint("ragged profile: ",pi.size()," and ",dim);)
			return rval;
		}
	}

	double n = static_cast<double>(profile.size());
	for (size_t d=0; d<dim; d++) {
		VariableMetrics vm;
		// a non-finite value makes every measure of the variable NaN
		bool valid{true};
		for (auto& pi : profile)
			valid = valid && is_valid(pi[d]);
		if (!valid) {
			T_(trc.dprint("variable ",d," has non-finite values");)
			vm.min = vm.max = vm.range = vm.mean = vm.rms = nan();
			rval.vars.push_back(vm);
			continue;
		}
		vm.min = profile[0][d];
		vm.max = profile[0][d];
		double sum{0.0};
		for (auto& pi : profile) {
			vm.min = std::min(vm.min, pi[d]);
			vm.max = std::max(vm.max, pi[d]);
			sum += pi[d];
		}
		vm.range = vm.max - vm.min;
		vm.mean = sum/n;
		double ss{0.0};
		for (auto& pi : profile) {
			double t = pi[d] - vm.mean;
			ss += t*t;
		}
		vm.rms = std::sqrt(ss/n);
		T_(trc.dprint("variable ",d,": ",vm);)
		rval.vars.push_back(vm);
	}
	return rval;
}

} // namespace bifview
