//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
#ifndef EIGEN_H
#define EIGEN_H

// Eigen-data normalization: every other module works with
// eigenvalues (or Floquet multipliers) as a vector<ComplexValue>
// produced here from whatever shape the solver stored

#include <vector>

#include "branch.h"

namespace bifview {

// Convert raw eigen-data to an ordered list of complex values.
// Absent data gives an empty list. A value with a missing or NaN
// component becomes (NaN,NaN) in place so the positions of the
// remaining values do not shift. A flat list of odd length has
// a final value with a missing imaginary part. Never throws.
std::vector<ComplexValue> normalize_eigenvalues(const RawEigen& raw);

// eigenvalues of the (n,n) column-major matrix "a" (a Jacobian or a
// monodromy matrix). Throws runtime_error if "a" is not (n,n) or
// LAPACK fails
std::vector<ComplexValue> eigenvalues_of(int n, const std::vector<double>& a);

// true if a point was stored without usable eigen-data: none at all
// or a NaN first value
bool needs_eigen_hydration(const ContinuationPoint& pt);

// storage positions of the points of a branch that need their
// eigenvalues recomputed; codimension-1 curves of equilibria
// (fold and Hopf curves) carry none and are skipped
std::vector<StoragePos> points_needing_eigenvalues(const Branch& branch);

// Angular frequency of the critical pair at a Hopf point: among the
// finite eigenvalues with |im| >= 1e-3*max|im| the one with the
// smallest |re| (ties: the larger |im|); returns its |im|, or 1
// if there is no complex pair
double hopf_frequency(const std::vector<ComplexValue>& ev);

// modulus of a complex value
double modulus(const ComplexValue& z);

} // namespace bifview

#endif // EIGEN_H
