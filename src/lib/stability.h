//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
#ifndef STABILITY_H
#define STABILITY_H

//------------------------------------------------------------------
// Stability classification from eigen-data.
// Derived labels are only ever Stable, Unstable or None (a boundary
// case: a real part or modulus within the tolerance of the stability
// boundary, or no usable data). Bifurcation kinds (Fold, Hopf, ...)
// come from the solver's test functions and are never derived here;
// point_stability() merges the two, preferring the solver's tag.
//------------------------------------------------------------------

#include <string>
#include <vector>

#include "branch.h"

namespace bifview {

constexpr double default_stability_tol{1.0e-6};
constexpr double default_trivial_tol{1.0e-2};

// the tolerances configured in Settings::defaults
// ("stability_tol" and "trivial_tol")
double stability_tol();
double trivial_tol();

// equilibrium of a flow: sign of the real parts
StabilityKind classify_flow(const std::vector<ComplexValue>& ev,
		double eps=default_stability_tol);

// fixed point or cycle of a map: moduli relative to 1
StabilityKind classify_map(const std::vector<ComplexValue>& ev,
		double eps=default_stability_tol);

// Periodic orbit of a flow: the Floquet multiplier closest to 1 is
// the trivial one (tangent to the orbit) and is left out; the rest
// are classified like the eigenvalues of a map
StabilityKind classify_cycle(const std::vector<ComplexValue>& multipliers,
		double eps=default_stability_tol);

// derive the label for a point on a branch of type "bk" in a
// system of kind "sk" from its eigen-data alone
StabilityKind derive_stability(const ContinuationPoint& pt, SystemKind sk,
		BranchKind bk, double eps=default_stability_tol);

// the label to show for a point: the solver's tag if it assigned
// one other than None, otherwise derive_stability()
StabilityKind point_stability(const ContinuationPoint& pt, SystemKind sk,
		BranchKind bk, double eps=default_stability_tol);

// Short description of the stability of a periodic orbit from its
// Floquet multipliers: "stable", "unstable (torus)" if an unstable
// multiplier is complex, "unstable (kD)" for k unstable real
// multipliers, "unknown" with no multipliers. Multipliers within
// trivial_tol of 1 are taken as trivial
std::string describe_cycle_stability(const std::vector<ComplexValue>& multipliers,
		double trivial_tol=default_trivial_tol);

} // namespace bifview

#endif // STABILITY_H
