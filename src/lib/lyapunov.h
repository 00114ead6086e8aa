//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
#ifndef LYAPUNOV_H
#define LYAPUNOV_H

#include <optional>
#include <vector>

namespace bifview {

// Kaplan-Yorke (Lyapunov) dimension of an attractor from its
// spectrum of Lyapunov exponents, in any order:
//   D = k + S_k/|l_{k+1}|
// with the exponents sorted in decreasing order, S_k the sum of the
// first k and k the last position where the partial sum is still
// non-negative. The dimension is the number of exponents if the total
// is non-negative, and exactly k if |l_{k+1}| is below machine epsilon.
// Returns nullopt (not computable) for an empty spectrum or one
// containing NaN or infinity
std::optional<double> kaplan_yorke_dimension(std::vector<double> exponents);

} // namespace bifview

#endif // LYAPUNOV_H
