//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
#ifndef PROFILE_H
#define PROFILE_H

//------------------------------------------------------------------
// Periodic-orbit profiles from the solution vector of a
// boundary-value collocation discretization with ntst mesh intervals
// and ncol collocation points per interval.
//------------------------------------------------------------------

#include <vector>

#include "branch.h"

namespace bifview {

// layout of the collocation vector; mesh-first is
//   x(0,0) ... x(0,dim-1), x(1,0) ... x(ntst*ncol-1,dim-1), period
// i.e. element (meshIndex*dim + varIndex) followed by the period
enum class MeshLayout { MeshFirst };

struct CycleProfile {
	std::vector<std::vector<double>> points;  // ntst*ncol points of length dim
	double period;                            // NaN if the vector is malformed
};

// Unpack a collocation vector. If state.size() != ntst*ncol*dim + 1
// (stale mesh metadata, a system edit) the profile is empty and the
// period NaN; nothing is thrown
CycleProfile extract_profile(const std::vector<double>& state, int dim,
		const Mesh& mesh, MeshLayout layout=MeshLayout::MeshFirst);

// the mesh of a branch of periodic orbits, "fallback" if the
// branch carries no mesh metadata
Mesh branch_mesh(const Branch& branch, const Mesh& fallback);

} // namespace bifview

#endif // PROFILE_H
