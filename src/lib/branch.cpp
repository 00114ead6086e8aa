//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-

#include <map>

#include "branch.h"
#include "settings.h"

using namespace std;

namespace bifview {

std::ostream&
operator<<(std::ostream& s, const ComplexValue& t) {
	s << '(' << t.re << ',' << t.im << ')';
	return s;
}

std::ostream&
operator<<(std::ostream& s, const ContinuationSettings& t) {
	s << "step_size " << t.step_size
		<< ", min_step_size " << t.min_step_size
		<< ", max_step_size " << t.max_step_size
		<< ", max_steps " << t.max_steps
		<< ", corrector_steps " << t.corrector_steps
		<< ", corrector_tolerance " << t.corrector_tolerance
		<< ", step_tolerance " << t.step_tolerance;
	return s;
}

Mesh
default_mesh() {
	Mesh rval;
	Settings::defaults.get("ntst", rval.ntst);
	Settings::defaults.get("ncol", rval.ncol);
	return rval;
}

namespace {

// one operator() per alternative: adding a BranchType alternative
// is a compile error until every visitor handles it
struct Codim1Names {
	using result = optional<pair<string,string>>;
	result operator()(const Equilibrium&) const { return nullopt; }
	result operator()(const LimitCycle&) const { return nullopt; }
	result operator()(const FoldCurve& c) const { return make_pair(c.param1_name, c.param2_name); }
	result operator()(const HopfCurve& c) const { return make_pair(c.param1_name, c.param2_name); }
	result operator()(const LPCCurve& c) const { return make_pair(c.param1_name, c.param2_name); }
	result operator()(const PDCurve& c) const { return make_pair(c.param1_name, c.param2_name); }
	result operator()(const NSCurve& c) const { return make_pair(c.param1_name, c.param2_name); }
};

struct MeshOf {
	optional<Mesh> operator()(const Equilibrium&) const { return nullopt; }
	optional<Mesh> operator()(const LimitCycle& c) const { return Mesh{c.ntst, c.ncol}; }
	optional<Mesh> operator()(const FoldCurve&) const { return nullopt; }
	optional<Mesh> operator()(const HopfCurve&) const { return nullopt; }
	optional<Mesh> operator()(const LPCCurve& c) const { return Mesh{c.ntst, c.ncol}; }
	optional<Mesh> operator()(const PDCurve& c) const { return Mesh{c.ntst, c.ncol}; }
	optional<Mesh> operator()(const NSCurve& c) const { return Mesh{c.ntst, c.ncol}; }
};

struct KindOf {
	BranchKind operator()(const Equilibrium&) const { return BranchKind::Equilibrium; }
	BranchKind operator()(const LimitCycle&) const { return BranchKind::LimitCycle; }
	BranchKind operator()(const FoldCurve&) const { return BranchKind::FoldCurve; }
	BranchKind operator()(const HopfCurve&) const { return BranchKind::HopfCurve; }
	BranchKind operator()(const LPCCurve&) const { return BranchKind::LPCCurve; }
	BranchKind operator()(const PDCurve&) const { return BranchKind::PDCurve; }
	BranchKind operator()(const NSCurve&) const { return BranchKind::NSCurve; }
};

const map<StabilityKind,string>&
stability_tags() {
	static const map<StabilityKind,string> tags{
		{StabilityKind::None, "None"},
		{StabilityKind::Stable, "Stable"},
		{StabilityKind::Unstable, "Unstable"},
		{StabilityKind::Fold, "Fold"},
		{StabilityKind::Hopf, "Hopf"},
		{StabilityKind::PeriodDoubling, "PeriodDoubling"},
		{StabilityKind::NeimarkSacker, "NeimarkSacker"},
		{StabilityKind::CycleFold, "CycleFold"},
		{StabilityKind::NeutralSaddle, "NeutralSaddle"}
	};
	return tags;
}

const map<BranchKind,string>&
branch_kind_names() {
	static const map<BranchKind,string> names{
		{BranchKind::Equilibrium, "equilibrium"},
		{BranchKind::LimitCycle, "limit_cycle"},
		{BranchKind::FoldCurve, "fold_curve"},
		{BranchKind::HopfCurve, "hopf_curve"},
		{BranchKind::LPCCurve, "lpc_curve"},
		{BranchKind::PDCurve, "pd_curve"},
		{BranchKind::NSCurve, "ns_curve"}
	};
	return names;
}

} // namespace

optional<pair<string,string>>
codim1_names(const BranchType& bt) {
	return std::visit(Codim1Names{}, bt);
}

optional<Mesh>
mesh_of(const BranchType& bt) {
	return std::visit(MeshOf{}, bt);
}

BranchKind
kind_of(const BranchType& bt) {
	return std::visit(KindOf{}, bt);
}

string
to_string(StabilityKind k) {
	return stability_tags().at(k);
}

StabilityKind
parse_stability(const string& tag) {
	for (auto& ti : stability_tags())
		if (ti.second == tag)
			return ti.first;
	return StabilityKind::None;
}

string
to_string(BranchKind k) {
	return branch_kind_names().at(k);
}

optional<BranchKind>
parse_branch_kind(const string& s) {
	for (auto& ni : branch_kind_names())
		if (ni.second == s)
			return ni.first;
	return nullopt;
}

bool
is_cycle_branch(BranchKind k) {
	return k == BranchKind::LimitCycle
		|| k == BranchKind::LPCCurve
		|| k == BranchKind::PDCurve
		|| k == BranchKind::NSCurve;
}

BranchKind
branch_kind(const Branch& branch) {
	if (branch.data.branch_type)
		return kind_of(*branch.data.branch_type);
	return branch.type;
}

} // namespace bifview
