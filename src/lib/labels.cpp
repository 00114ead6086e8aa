//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-

#include <cctype>
#include <map>

#include "labels.h"
#include "text.h"
#include "vastr.h"

using namespace std;

namespace bifview {

static const map<string,string>&
type_names() {
	static const map<string,string> names{
		{"Fold", "Fold"},
		{"Hopf", "Hopf"},
		{"NeutralSaddle", "Neutral Saddle"},
		{"CycleFold", "Cycle Fold"},
		{"PeriodDoubling", "Period Doubling"},
		{"NeimarkSacker", "Neimark-Sacker"},
		{"Cusp", "Cusp"},
		{"BogdanovTakens", "Bogdanov-Takens"},
		{"ZeroHopf", "Zero-Hopf"},
		{"DoubleHopf", "Double-Hopf"},
		{"GeneralizedHopf", "Generalized Hopf"},
		{"CuspOfCycles", "Cusp of Cycles"},
		{"FoldFlip", "Fold-Flip"},
		{"FoldNeimarkSacker", "Fold-Neimark-Sacker"},
		{"FlipNeimarkSacker", "Flip-Neimark-Sacker"},
		{"DoubleNeimarkSacker", "Double Neimark-Sacker"},
		{"GeneralizedPeriodDoubling", "Generalized Period Doubling"},
		{"Chenciner", "Chenciner"},
		{"Resonance1_1", "Resonance 1:1"},
		{"Resonance1_2", "Resonance 1:2"},
		{"Resonance1_3", "Resonance 1:3"},
		{"Resonance1_4", "Resonance 1:4"}
	};
	return names;
}

string
bifurcation_type_name(const string& tag) {
	if (tag.empty() || tag == "None")
		return "Unknown";
	auto it = type_names().find(tag);
	if (it != type_names().end())
		return it->second;

	// split CamelCase and underscores into words
	string rval;
	for (size_t i=0; i<tag.size(); i++) {
		char c = tag[i];
		if (c == '_') {
			rval += ' ';
			continue;
		}
		if (i > 0 && isupper((unsigned char)c) && islower((unsigned char)tag[i-1]))
			rval += ' ';
		rval += c;
	}
	rval = stripwhitespace(rval);
	return rval.empty() ? "Unknown" : rval;
}

string
bifurcation_type_name(StabilityKind kind) {
	return bifurcation_type_name(to_string(kind));
}

string
bifurcation_label(int logical, optional<StabilityKind> kind) {
	string type = kind ? bifurcation_type_name(*kind) : "Unknown";
	return vastr("Index ",logical," - ",type);
}

string
equilibrium_label(SystemKind sk, int map_iterations, bool plural, bool lowercase) {
	string rval;
	if (sk == SystemKind::Flow) {
		rval = plural ? "Equilibria" : "Equilibrium";
	} else if (map_iterations <= 1) {
		rval = plural ? "Fixed points" : "Fixed point";
	} else {
		// starts with a digit: no case to change
		return vastr(map_iterations, plural ? "-cycles" : "-cycle");
	}
	return lowercase ? stringLower(rval) : rval;
}

string
branch_type_label(SystemKind sk, const Branch& branch) {
	BranchKind kind = branch_kind(branch);
	if (sk == SystemKind::Map && kind == BranchKind::Equilibrium)
		return equilibrium_label(sk, branch.map_iterations, false, true);
	string rval = to_string(kind);
	for (auto& c : rval)
		if (c == '_')
			c = ' ';
	return rval;
}

} // namespace bifview
