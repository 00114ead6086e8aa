//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
#ifndef SUMMARY_H
#define SUMMARY_H

//------------------------------------------------------------------
// Text descriptions of branches and points for a point browser:
// a summary (start, bifurcations, end), one-line rows in logical
// order, and a detailed description of a single point.
// Storage positions that are not on the branch throw std::out_of_range.
// The text is UTF-8: bullets, arrows, ellipses and the Greek letters
// mu and lambda are written as universal character names.
//------------------------------------------------------------------

#include <optional>
#include <string>
#include <vector>

#include "branch.h"
#include "stability.h"

namespace bifview {

// "Eigenvalues: a+bi, c+di, e+fi ..." (first three values, then an ellipsis);
// "Multipliers: ..." on branches of periodic orbits
std::string summarize_eigenvalues(const ContinuationPoint& pt, BranchKind kind);

// One line describing a point:
//   "* Index 12 | mu=0.250 | Eigenvalues: ... [Hopf]"
// '*' marks special points; the solver tag is appended unless None.
// "indices" are the logical indices (see ensure_indices)
std::string point_row(const Branch& branch, const std::vector<int>& indices,
		StoragePos pos);

struct SummaryEntry {
	std::string text;
	StoragePos pos;
};

// The start point, the special points in logical order, and the end
// point (left out if it is the start point); empty for a branch
// with no points
std::vector<SummaryEntry> branch_summary(const Branch& branch);

struct DetailOptions {
	Mesh mesh;                                   // if the branch has none
	double eps{default_stability_tol};           // stability classification
	double trivial_tol{default_trivial_tol};     // trivial Floquet multiplier
};

// the options configured in Settings::defaults
DetailOptions detail_options();

// Multi-line description of the point at "pos": the parameter values
// (continuation parameters marked) followed, for periodic orbits, by
// period, stability, amplitude, mean and rms of each variable and the
// Floquet multipliers, otherwise by stability, eigenvalues and state.
// parent_params are the parameters of the object the branch was
// started from (may be empty)
std::string point_details(const SystemConfig& system, const Branch& branch,
		StoragePos pos, const std::vector<double>& parent_params,
		const DetailOptions& opts=DetailOptions());

// continuations that can be started from a point
enum class PointAction {
	NewEquilibriumBranch,
	LimitCycleFromHopf,
	HopfCurve,
	FoldCurve,
	NewLimitCycleBranch,
	PeriodDoubledCycle,
	PDCurve,
	LPCCurve,
	NSCurve
};

std::string to_string(PointAction a);

// the continuations available from a point on a branch of type
// "kind" with solver tag "tag"
std::vector<PointAction> point_actions(BranchKind kind, std::optional<StabilityKind> tag);

} // namespace bifview

#endif // SUMMARY_H
