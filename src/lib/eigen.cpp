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
#include <stdexcept>

#include "eigen.h"
#include "fptype.h"
#include "lapack.h"
#include "trace.h"

using namespace std;

namespace bifview {

namespace {

// one operator() per RawEigen alternative
struct Normalizer {
	vector<ComplexValue> operator()(const monostate&) const { return {}; }

	vector<ComplexValue> operator()(const vector<double>& flat) const {
		vector<ComplexValue> rval;
		for (size_t i=0; i<flat.size(); i += 2) {
			double re = flat[i];
			double im = (i+1 < flat.size()) ? flat[i+1] : nan();
			rval.push_back(make(re, im));
		}
		return rval;
	}

	vector<ComplexValue> operator()(const vector<EigenRecord>& recs) const {
		vector<ComplexValue> rval;
		for (auto& ri : recs)
			rval.push_back(make(ri.re.value_or(nan()), ri.im.value_or(nan())));
		return rval;
	}

	static ComplexValue make(double re, double im) {
		if (std::isnan(re) || std::isnan(im))
			return ComplexValue{nan(), nan()};
		return ComplexValue{re, im};
	}
};

} // namespace

vector<ComplexValue>
normalize_eigenvalues(const RawEigen& raw) {
	return std::visit(Normalizer{}, raw);
}

vector<ComplexValue>
eigenvalues_of(int n, const vector<double>& a) {
	T_(Trace trc(1,"eigenvalues_of ",n);)
	if (n <= 0)
		return {};
	if (a.size() != static_cast<size_t>(n)*n)
		throw runtime_error(vastr("eigenvalues_of: matrix has ",a.size(),
			" elements, expecting ",n,"x",n));

	// dgeev overwrites its matrix
	vector<double> work(a);
	vector<double> wr(n, 0.0);
	vector<double> wi(n, 0.0);
	int info = lapack::dgeev("n", "n", n, work.data(), n, wr.data(), wi.data(),
			nullptr, 1, nullptr, 1);
	if (info != 0)
		throw runtime_error(vastr("eigenvalue decomposition of a ",n,"x",n,
			" matrix failed: dgeev returned info ",info));

	vector<ComplexValue> rval;
	for (int i=0; i<n; i++)
		rval.push_back(ComplexValue{wr[i], wi[i]});
	T_(trc.dprintv(rval, "eigenvalues");)
	return rval;
}

bool
needs_eigen_hydration(const ContinuationPoint& pt) {
	vector<ComplexValue> ev = normalize_eigenvalues(pt.eigenvalues);
	return ev.empty() || std::isnan(ev[0].re);
}

vector<StoragePos>
points_needing_eigenvalues(const Branch& branch) {
	vector<StoragePos> rval;
	BranchKind kind = branch_kind(branch);
	if (kind == BranchKind::FoldCurve || kind == BranchKind::HopfCurve)
		return rval;
	for (StoragePos i=0; i<branch.data.points.size(); i++)
		if (needs_eigen_hydration(branch.data.points[i]))
			rval.push_back(i);
	return rval;
}

double
hopf_frequency(const vector<ComplexValue>& ev) {
	T_(Trace trc(2,"hopf_frequency");)
	double maxim{0.0};
	for (auto& ei : ev) {
		if (!is_valid(ei.re) || !is_valid(ei.im))
			continue;
		maxim = std::max(maxim, std::abs(ei.im));
	}
	if (maxim <= 0.0)
		return 1.0;

	// ignore eigenvalues that are real to within roundoff
	double minim = 1.0e-3*maxim;
	double bestre = std::numeric_limits<double>::infinity();
	double bestim{0.0};
	for (auto& ei : ev) {
		if (!is_valid(ei.re) || !is_valid(ei.im))
			continue;
		double absre = std::abs(ei.re);
		double absim = std::abs(ei.im);
		if (absim < minim)
			continue;
		if (absre < bestre || (absre == bestre && absim > bestim)) {
			bestre = absre;
			bestim = absim;
		}
	}
	T_(trc.dprint("returning ",bestim);)
	return bestim;
}

double
modulus(const ComplexValue& z) {
	return std::hypot(z.re, z.im);
}

} // namespace bifview
