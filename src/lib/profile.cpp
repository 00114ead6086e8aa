//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-

#include "fptype.h"
#include "profile.h"
#include "trace.h"

using namespace std;

namespace bifview {

CycleProfile
extract_profile(const vector<double>& state, int dim, const Mesh& mesh,
		MeshLayout layout) {
	T_(Trace trc(2,"extract_profile ",dim," dimensions, ntst ",mesh.ntst,
		", ncol ",mesh.ncol);)
	CycleProfile rval{{}, nan()};

	if (dim <= 0 || mesh.ntst <= 0 || mesh.ncol <= 0)
		return rval;
	size_t npts = static_cast<size_t>(mesh.ntst)*mesh.ncol;
	size_t ndim = static_cast<size_t>(dim);
	if (state.size() != npts*ndim + 1) {
		T_(trc.dprint("state has ",state.size()," elements, expecting ",npts*ndim+1);)
		return rval;
	}

	switch (layout) {
		case MeshLayout::MeshFirst:
			rval.points.reserve(npts);
			for (size_t i=0; i<npts; i++) {
				auto first = state.begin() + i*ndim;
				rval.points.emplace_back(first, first + ndim);
			}
			break;
	}
	rval.period = state.back();
	T_(trc.dprint("period ",rval.period);)
	return rval;
}

Mesh
branch_mesh(const Branch& branch, const Mesh& fallback) {
	if (branch.data.branch_type) {
		optional<Mesh> m = mesh_of(*branch.data.branch_type);
		if (m && m->ntst > 0 && m->ncol > 0)
			return *m;
	}
	return fallback;
}

} // namespace bifview
