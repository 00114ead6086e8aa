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
#include <functional>
#include <limits>

#include "fptype.h"
#include "lyapunov.h"
#include "trace.h"

using namespace std;

namespace bifview {

optional<double>
kaplan_yorke_dimension(vector<double> exponents) {
	T_(Trace trc(1,"kaplan_yorke_dimension");)
	if (exponents.empty() || !is_valid(exponents))
		return nullopt;

	std::sort(exponents.begin(), exponents.end(), std::greater<double>());
	T_(trc.dprintv(exponents, "sorted exponents");)

	double eps = std::numeric_limits<double>::epsilon();
	double partial{0.0};
	size_t n = exponents.size();
	for (size_t i=0; i<n; i++) {
		double next = partial + exponents[i];
		if (next >= 0.0) {
			partial = next;
			continue;
		}
		// adding exponent i makes the sum negative: k = i
		double absl = std::abs(exponents[i]);
		T_(trc.dprint("k = ",i,", S_k = ",partial,", |l_k+1| = ",absl);)
		if (absl < eps)
			return static_cast<double>(i);
		return static_cast<double>(i) + partial/absl;
	}
	// the sum of all exponents is non-negative
	return static_cast<double>(n);
}

} // namespace bifview
