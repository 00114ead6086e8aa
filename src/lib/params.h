//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
#ifndef PARAMS_H
#define PARAMS_H

// Parameter values at a point on a branch: the base parameter vector
// (system defaults or an object override) with the one or two
// continuation parameters replaced by the values at the point

#include <string>
#include <vector>

#include "branch.h"

namespace bifview {

// parameter overrides closer than this to the system defaults
// are not custom
constexpr double param_epsilon{1.0e-12};

// is "override" a usable replacement for the system parameters:
// same length and all values finite?
bool is_valid_param_set(const std::vector<double>& system_params,
		const std::vector<double>& override);

// "override" if it is valid, otherwise the system parameters
std::vector<double> resolve_object_params(const SystemConfig& system,
		const std::vector<double>& override);

// does a valid "override" differ from the system parameters?
bool has_custom_params(const SystemConfig& system,
		const std::vector<double>& override);

// Base parameters of a branch: the branch's own parameters if valid,
// else those of the object it was started from (parent_params) if
// valid, else the system parameters
std::vector<double> branch_base_params(const SystemConfig& system,
		const Branch& branch, const std::vector<double>& parent_params);

// names of the parameters varied along a branch: param1 and param2
// of a codimension-1 curve, otherwise the branch parameter
std::vector<std::string> continuation_param_names(const Branch& branch);

// The full parameter vector at point "pt" of "branch": "base" with
// the continuation parameter(s) replaced by the point's value(s).
// Names that are not in "names" are skipped; a missing param2_value
// leaves the base value
std::vector<double> reconstruct_params(const std::vector<std::string>& names,
		const std::vector<double>& base, const Branch& branch,
		const ContinuationPoint& pt);

} // namespace bifview

#endif // PARAMS_H
