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

#include "fptype.h"
#include "params.h"
#include "trace.h"

using namespace std;

namespace bifview {

bool
is_valid_param_set(const vector<double>& system_params, const vector<double>& override) {
	if (override.size() != system_params.size())
		return false;
	return is_valid(override);
}

vector<double>
resolve_object_params(const SystemConfig& system, const vector<double>& override) {
	if (is_valid_param_set(system.params, override))
		return override;
	return system.params;
}

bool
has_custom_params(const SystemConfig& system, const vector<double>& override) {
	if (!is_valid_param_set(system.params, override))
		return false;
	for (size_t i=0; i<override.size(); i++)
		if (std::abs(override[i] - system.params[i]) > param_epsilon)
			return true;
	return false;
}

vector<double>
branch_base_params(const SystemConfig& system, const Branch& branch,
		const vector<double>& parent_params) {
	T_(Trace trc(2,"branch_base_params ",branch.name);)
	if (is_valid_param_set(system.params, branch.params)) {
		T_(trc.dprint("using the branch parameters");)
		return branch.params;
	}
	if (is_valid_param_set(system.params, parent_params)) {
		T_(trc.dprint("using the parameters of ",branch.parent_object);)
		return parent_params;
	}
	T_(trc.dprint("using the system parameters");)
	return system.params;
}

vector<string>
continuation_param_names(const Branch& branch) {
	if (branch.data.branch_type) {
		auto names = codim1_names(*branch.data.branch_type);
		if (names)
			return {names->first, names->second};
	}
	return {branch.parameter_name};
}

// set the value of parameter "name" if it is in the list
static void
override_param(const vector<string>& names, vector<double>& params,
		const string& name, double value) {
	auto it = std::find(names.begin(), names.end(), name);
	if (it == names.end())
		return;
	size_t k = it - names.begin();
	if (k < params.size())
		params[k] = value;
}

vector<double>
reconstruct_params(const vector<string>& names, const vector<double>& base,
		const Branch& branch, const ContinuationPoint& pt) {
	T_(Trace trc(2,"reconstruct_params");)
	vector<double> rval(base);

	optional<pair<string,string>> codim1;
	if (branch.data.branch_type)
		codim1 = codim1_names(*branch.data.branch_type);

	if (codim1) {
		override_param(names, rval, codim1->first, pt.param_value);
		if (pt.param2_value)
			override_param(names, rval, codim1->second, *pt.param2_value);
	} else {
		override_param(names, rval, branch.parameter_name, pt.param_value);
	}
	T_(trc.dprintv(rval, "parameters");)
	return rval;
}

} // namespace bifview
