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
#include <sstream>
#include <stdexcept>

#include "eigen.h"
#include "format.h"
#include "fptype.h"
#include "index.h"
#include "metrics.h"
#include "params.h"
#include "profile.h"
#include "summary.h"
#include "trace.h"

using namespace std;

namespace bifview {

static const ContinuationPoint&
point_at(const Branch& branch, StoragePos pos) {
	if (pos >= branch.data.points.size())
		throw out_of_range(vastr("storage position ",pos," is not on branch \"",
			branch.name,"\" (",branch.data.points.size()," points)"));
	return branch.data.points[pos];
}

static bool
is_special(const Branch& branch, StoragePos pos) {
	const vector<StoragePos>& bif = branch.data.bifurcations;
	return std::find(bif.begin(), bif.end(), pos) != bif.end();
}

// the solver tag, "None" if the point has none
static string
tag_of(const ContinuationPoint& pt) {
	return to_string(pt.stability.value_or(StabilityKind::None));
}

static bool
has_tag(const ContinuationPoint& pt) {
	return pt.stability && *pt.stability != StabilityKind::None;
}

// "mu=0.250" or "a=0.100, b=2.000" on codimension-1 curves
static string
param_display(const Branch& branch, const ContinuationPoint& pt) {
	if (branch.data.branch_type) {
		auto names = codim1_names(*branch.data.branch_type);
		if (names) {
			string p2 = pt.param2_value ? fmt_num(*pt.param2_value) : "?";
			return vastr(names->first,"=",fmt_num(pt.param_value),", ",
				names->second,"=",p2);
		}
	}
	return vastr(branch.parameter_name,"=",fmt_num(pt.param_value));
}

static string
var_name(const SystemConfig& system, size_t d) {
	if (d < system.var_names.size() && !system.var_names[d].empty())
		return system.var_names[d];
	return vastr("x",d);
}

string
summarize_eigenvalues(const ContinuationPoint& pt, BranchKind kind) {
	string label = is_cycle_branch(kind) ? "Multipliers" : "Eigenvalues";
	vector<ComplexValue> ev = normalize_eigenvalues(pt.eigenvalues);
	if (ev.empty())
		return label + ": []";
	string rval = label + ": ";
	string sep;
	for (size_t i=0; i<ev.size() && i<3; i++) {
		rval += sep + fmt_safe(ev[i].re) + "+" + fmt_safe(ev[i].im) + "i";
		sep = ", ";
	}
	if (ev.size() > 3)
		rval += " \u2026";
	return rval;
}

string
point_row(const Branch& branch, const vector<int>& indices, StoragePos pos) {
	const ContinuationPoint& pt = point_at(branch, pos);
	if (pos >= indices.size())
		throw out_of_range(vastr("no logical index for storage position ",pos));
	char prefix = is_special(branch, pos) ? '*' : ' ';
	string type = has_tag(pt) ? vastr(" [",tag_of(pt),"]") : "";
	return vastr(prefix," Index ",indices[pos]," | ",param_display(branch, pt),
		" | ",summarize_eigenvalues(pt, branch_kind(branch)),type);
}

vector<SummaryEntry>
branch_summary(const Branch& branch) {
	T_(Trace trc(1,"branch_summary ",branch.name);)
	vector<SummaryEntry> rval;
	Navigator nav(branch.data);
	if (nav.empty())
		return rval;
	const vector<int>& indices = nav.indices();
	const vector<ContinuationPoint>& pts = branch.data.points;

	auto entry = [&](const string& label, StoragePos pos) {
		const ContinuationPoint& pt = pts[pos];
		return SummaryEntry{vastr(label," \u2022 Index ",indices[pos]," \u2022 ",
			param_display(branch, pt)," \u2022 ",tag_of(pt)), pos};
	};

	StoragePos start = *nav.start();
	StoragePos end = *nav.end();
	rval.push_back(entry("Start Point", start));

	// special points in logical order; positions not on the branch are ignored
	vector<StoragePos> bif;
	for (auto bi : branch.data.bifurcations)
		if (bi < pts.size())
			bif.push_back(bi);
	std::stable_sort(bif.begin(), bif.end(),
		[&indices](StoragePos a, StoragePos b) { return indices[a] < indices[b]; });
	for (size_t i=0; i<bif.size(); i++)
		rval.push_back(entry(vastr("Bifurcation ",i+1), bif[i]));

	if (end != start)
		rval.push_back(entry("End Point", end));
	T_(trc.dprint("summary has ",rval.size()," entries");)
	return rval;
}

DetailOptions
detail_options() {
	DetailOptions rval;
	rval.mesh = default_mesh();
	rval.eps = stability_tol();
	rval.trivial_tol = trivial_tol();
	return rval;
}

static void
cycle_details(ostream& os, const SystemConfig& system, const Branch& branch,
		const ContinuationPoint& pt, const vector<ComplexValue>& ev,
		const DetailOptions& opts) {
	T_(Trace trc(2,"cycle_details");)
	int dim = static_cast<int>(system.var_names.size());
	Mesh mesh = branch_mesh(branch, opts.mesh);
	CycleProfile profile = extract_profile(pt.state, dim, mesh);
	CycleMetrics cm = cycle_metrics(profile.points, profile.period);

	string stability = has_tag(pt) ? tag_of(pt)
		: describe_cycle_stability(ev, opts.trivial_tol);
	os << "Period: " << fmt_num(cm.period) << "\n";
	os << "Stability: " << stability << "\n";

	os << "\nAmplitude (min \u2192 max):\n";
	if (cm.vars.empty())
		os << "  (profile not available)\n";
	for (size_t d=0; d<cm.vars.size(); d++) {
		const VariableMetrics& vm = cm.vars[d];
		os << "  " << var_name(system, d) << ": " << fmt_num(vm.min) << " \u2192 "
			<< fmt_num(vm.max) << "  (range: " << fmt_num(vm.range) << ")\n";
	}

	os << "\nMean position & RMS amplitude:\n";
	if (cm.vars.empty())
		os << "  (profile not available)\n";
	for (size_t d=0; d<cm.vars.size(); d++) {
		const VariableMetrics& vm = cm.vars[d];
		os << "  " << var_name(system, d) << ": mean=" << fmt_num(vm.mean)
			<< ", rms=" << fmt_num(vm.rms) << "\n";
	}

	os << "\nFloquet multipliers:\n";
	if (ev.empty())
		os << "  (none)\n";
	for (size_t i=0; i<ev.size(); i++) {
		bool trivial = std::abs(ev[i].re - 1.0) < opts.trivial_tol
			&& std::abs(ev[i].im) < opts.trivial_tol;
		os << "  \u03BC" << i << ": " << fmt_safe(ev[i].re) << " + "
			<< fmt_safe(ev[i].im) << "i  |\u03BC|=" << fmt_num(modulus(ev[i]))
			<< (trivial ? " (trivial)" : "") << "\n";
	}
}

static void
equilibrium_details(ostream& os, const SystemConfig& system, const Branch& branch,
		const ContinuationPoint& pt, const vector<ComplexValue>& ev,
		const DetailOptions& opts) {
	StabilityKind sk = point_stability(pt, system.kind, branch_kind(branch), opts.eps);
	os << "Stability: " << to_string(sk) << "\n";
	os << "Eigenvalues:\n";
	if (ev.empty())
		os << "  (none)\n";
	for (size_t i=0; i<ev.size(); i++)
		os << "  \u03BB" << i << ": " << fmt_safe(ev[i].re) << " + "
			<< fmt_safe(ev[i].im) << "i\n";
	os << "State: " << fmt_array(pt.state) << "\n";
	if (pt.cycle_points && !pt.cycle_points->empty()) {
		os << "Cycle points:\n";
		for (auto& ci : *pt.cycle_points)
			os << "  " << fmt_array(ci) << "\n";
	}
}

string
point_details(const SystemConfig& system, const Branch& branch, StoragePos pos,
		const vector<double>& parent_params, const DetailOptions& opts) {
	T_(Trace trc(1,"point_details ",branch.name," ",pos);)
	const ContinuationPoint& pt = point_at(branch, pos);
	vector<int> indices = ensure_indices(branch.data);
	BranchKind kind = branch_kind(branch);
	ostringstream os;

	os << "Point " << indices[pos] << " (Array " << pos << ")";
	if (is_special(branch, pos)) {
		os << " [Bifurcation";
		if (has_tag(pt))
			os << ": " << tag_of(pt);
		os << "]";
	}
	if (kind == BranchKind::LimitCycle)
		os << " [Limit Cycle]";
	os << "\n";

	vector<double> base = branch_base_params(system, branch, parent_params);
	vector<double> params = reconstruct_params(system.param_names, base, branch, pt);
	vector<string> cont = continuation_param_names(branch);
	os << "Parameters:\n";
	for (size_t i=0; i<system.param_names.size(); i++) {
		const string& name = system.param_names[i];
		double value = i < params.size() ? params[i] : nan();
		bool is_cont = std::find(cont.begin(), cont.end(), name) != cont.end();
		os << "  " << name << ": " << fmt_full(value)
			<< (is_cont ? " \u2190 continuation" : "") << "\n";
	}

	vector<ComplexValue> ev = normalize_eigenvalues(pt.eigenvalues);
	if (is_cycle_branch(kind))
		cycle_details(os, system, branch, pt, ev, opts);
	else
		equilibrium_details(os, system, branch, pt, ev, opts);
	return os.str();
}

string
to_string(PointAction a) {
	switch (a) {
		case PointAction::NewEquilibriumBranch:
			return "Create New Equilibrium Branch";
		case PointAction::LimitCycleFromHopf:
			return "Initiate Limit Cycle Continuation";
		case PointAction::HopfCurve:
			return "Continue Hopf Curve (2-parameter)";
		case PointAction::FoldCurve:
			return "Continue Fold Curve (2-parameter)";
		case PointAction::NewLimitCycleBranch:
			return "Create New Limit Cycle Branch";
		case PointAction::PeriodDoubledCycle:
			return "Branch to Period-Doubled Limit Cycle";
		case PointAction::PDCurve:
			return "Continue PD Curve (2-parameter)";
		case PointAction::LPCCurve:
			return "Continue LPC Curve (2-parameter)";
		case PointAction::NSCurve:
			return "Continue NS Curve (2-parameter)";
	}
	throw runtime_error(vastr("unknown point action ",static_cast<int>(a)));
}

vector<PointAction>
point_actions(BranchKind kind, optional<StabilityKind> tag) {
	vector<PointAction> rval;
	StabilityKind t = tag.value_or(StabilityKind::None);
	if (kind == BranchKind::Equilibrium) {
		rval.push_back(PointAction::NewEquilibriumBranch);
		if (t == StabilityKind::Hopf) {
			rval.push_back(PointAction::LimitCycleFromHopf);
			rval.push_back(PointAction::HopfCurve);
		} else if (t == StabilityKind::Fold) {
			rval.push_back(PointAction::FoldCurve);
		}
	} else if (kind == BranchKind::LimitCycle) {
		rval.push_back(PointAction::NewLimitCycleBranch);
		if (t == StabilityKind::PeriodDoubling) {
			rval.push_back(PointAction::PeriodDoubledCycle);
			rval.push_back(PointAction::PDCurve);
		} else if (t == StabilityKind::CycleFold) {
			rval.push_back(PointAction::LPCCurve);
		} else if (t == StabilityKind::NeimarkSacker) {
			rval.push_back(PointAction::NSCurve);
		}
	}
	return rval;
}

} // namespace bifview
