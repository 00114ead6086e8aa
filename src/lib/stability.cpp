//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-

#include <cmath>
#include <limits>

#include "eigen.h"
#include "fptype.h"
#include "settings.h"
#include "stability.h"
#include "trace.h"

using namespace std;

namespace bifview {

double
stability_tol() {
	double rval{default_stability_tol};
	Settings::defaults.get("stability_tol", rval);
	return rval;
}

double
trivial_tol() {
	double rval{default_trivial_tol};
	Settings::defaults.get("trivial_tol", rval);
	return rval;
}

static bool
all_valid(const vector<ComplexValue>& ev) {
	for (auto& ei : ev)
		if (!is_valid(ei.re) || !is_valid(ei.im))
			return false;
	return true;
}

StabilityKind
classify_flow(const vector<ComplexValue>& ev, double eps) {
	T_(Trace trc(2,"classify_flow");)
	if (ev.empty() || !all_valid(ev))
		return StabilityKind::None;

	bool boundary{false};
	for (auto& ei : ev) {
		if (ei.re > eps)
			return StabilityKind::Unstable;
		if (ei.re >= -eps)
			boundary = true;
	}
	T_(trc.dprint("boundary? ",boundary);)
	return boundary ? StabilityKind::None : StabilityKind::Stable;
}

StabilityKind
classify_map(const vector<ComplexValue>& ev, double eps) {
	T_(Trace trc(2,"classify_map");)
	if (ev.empty() || !all_valid(ev))
		return StabilityKind::None;

	bool boundary{false};
	for (auto& ei : ev) {
		double mod = modulus(ei);
		if (mod > 1.0 + eps)
			return StabilityKind::Unstable;
		if (mod >= 1.0 - eps)
			boundary = true;
	}
	T_(trc.dprint("boundary? ",boundary);)
	return boundary ? StabilityKind::None : StabilityKind::Stable;
}

StabilityKind
classify_cycle(const vector<ComplexValue>& multipliers, double eps) {
	T_(Trace trc(2,"classify_cycle");)
	if (multipliers.size() < 2 || !all_valid(multipliers))
		return StabilityKind::None;

	// exactly one multiplier, the one closest to 1+0i, is trivial
	size_t trivial{0};
	double closest = std::numeric_limits<double>::infinity();
	for (size_t i=0; i<multipliers.size(); i++) {
		double d = std::hypot(multipliers[i].re - 1.0, multipliers[i].im);
		if (d < closest) {
			closest = d;
			trivial = i;
		}
	}
	T_(trc.dprint("trivial multiplier ",multipliers[trivial]);)

	vector<ComplexValue> rest;
	for (size_t i=0; i<multipliers.size(); i++)
		if (i != trivial)
			rest.push_back(multipliers[i]);
	return classify_map(rest, eps);
}

StabilityKind
derive_stability(const ContinuationPoint& pt, SystemKind sk, BranchKind bk, double eps) {
	vector<ComplexValue> ev = normalize_eigenvalues(pt.eigenvalues);
	if (sk == SystemKind::Map)
		return classify_map(ev, eps);
	if (is_cycle_branch(bk))
		return classify_cycle(ev, eps);
	return classify_flow(ev, eps);
}

StabilityKind
point_stability(const ContinuationPoint& pt, SystemKind sk, BranchKind bk, double eps) {
	if (pt.stability && *pt.stability != StabilityKind::None)
		return *pt.stability;
	return derive_stability(pt, sk, bk, eps);
}

string
describe_cycle_stability(const vector<ComplexValue>& multipliers, double trivial_tol) {
	if (multipliers.empty())
		return "unknown";

	int nunstable{0};
	bool torus{false};
	for (auto& mi : multipliers) {
		double mod = modulus(mi);
		if (std::abs(mod - 1.0) < trivial_tol && std::abs(mi.im) < trivial_tol)
			continue;
		if (mod > 1.0 + default_stability_tol) {
			nunstable++;
			// a complex unstable pair: Neimark-Sacker, the orbit becomes a torus
			if (std::abs(mi.im) > default_stability_tol)
				torus = true;
		}
	}
	if (nunstable == 0)
		return "stable";
	if (torus)
		return "unstable (torus)";
	return vastr("unstable (",nunstable,"D)");
}

} // namespace bifview
