//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
#ifndef BRANCH_H
#define BRANCH_H

//------------------------------------------------------------------
// Data model for continuation output: points, branches, and the
// system they belong to. A Branch is a read-only snapshot produced
// by an external continuation solver; nothing in bifview modifies
// one, so a Branch may be shared by concurrent queries.
//
// Storage position vs. logical index: points are stored in the
// order they were computed (append order). A branch extended in both
// directions from its starting point (logical index 0) appends the
// backward points with decreasing, negative logical indices, so the
// storage order is not the order along the curve. Functions that
// take or return a storage position use StoragePos; logical indices
// are int.
//------------------------------------------------------------------

#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace bifview {

// position of a point in BranchData::points
using StoragePos = std::size_t;

// continuous-time (ODE) or discrete-time (map) system
enum class SystemKind { Flow, Map };

enum class BranchKind {
	Equilibrium,
	LimitCycle,
	FoldCurve,
	HopfCurve,
	LPCCurve,
	PDCurve,
	NSCurve
};

// Stable/Unstable/None may be derived from eigen-data; the others
// are tags assigned by the solver from test-function sign changes
enum class StabilityKind {
	None,
	Stable,
	Unstable,
	Fold,
	Hopf,
	PeriodDoubling,
	NeimarkSacker,
	CycleFold,
	NeutralSaddle
};

enum class Direction { Forward, Backward };

struct ComplexValue {
	double re{0.0};
	double im{0.0};
};

std::ostream&
operator<<(std::ostream& s, const ComplexValue& t);

// an eigenvalue as stored by the solver: either part may be missing
struct EigenRecord {
	std::optional<double> re;
	std::optional<double> im;
};

// stored eigen-data comes in several shapes: absent, a flat list of
// alternating real and imaginary parts, or a list of records
using RawEigen = std::variant<std::monostate,
		std::vector<double>,
		std::vector<EigenRecord>>;

struct ContinuationPoint {
	std::vector<double> state;          // equilibrium state or collocation vector
	double param_value{0.0};            // primary continuation parameter
	std::optional<double> param2_value; // second parameter of a codim-1 curve
	RawEigen eigenvalues;               // eigenvalues or Floquet multipliers
	std::optional<StabilityKind> stability;  // solver tag, if any
	std::optional<std::vector<std::vector<double>>> cycle_points;  // map cycle orbit
};

// collocation mesh of a periodic orbit: ntst intervals with
// ncol collocation points each
struct Mesh {
	int ntst{20};
	int ncol{4};
};

// the mesh configured in Settings::defaults (ntst, ncol)
Mesh default_mesh();

// Branch metadata, one alternative per kind of branch
struct Equilibrium {};
struct LimitCycle {
	int ntst{20};
	int ncol{4};
};
struct FoldCurve {
	std::string param1_name;
	std::string param2_name;
};
struct HopfCurve {
	std::string param1_name;
	std::string param2_name;
};
struct LPCCurve {
	std::string param1_name;
	std::string param2_name;
	int ntst{20};
	int ncol{4};
};
struct PDCurve {
	std::string param1_name;
	std::string param2_name;
	int ntst{20};
	int ncol{4};
};
struct NSCurve {
	std::string param1_name;
	std::string param2_name;
	int ntst{20};
	int ncol{4};
};

using BranchType = std::variant<Equilibrium, LimitCycle, FoldCurve,
		HopfCurve, LPCCurve, PDCurve, NSCurve>;

// names of the two parameters varied along a codimension-1 curve,
// nullopt for single-parameter branches
std::optional<std::pair<std::string,std::string>>
codim1_names(const BranchType& bt);

// collocation mesh of branches made of periodic orbits,
// nullopt for branches of equilibria or maps
std::optional<Mesh> mesh_of(const BranchType& bt);

// the BranchKind corresponding to a BranchType alternative
BranchKind kind_of(const BranchType& bt);

struct BranchData {
	std::vector<ContinuationPoint> points;   // storage (append) order
	std::vector<StoragePos> bifurcations;    // special points
	std::vector<int> indices;                // logical index of each point
	std::optional<BranchType> branch_type;
};

struct ContinuationSettings {
	double step_size{0.01};
	double min_step_size{1.0e-5};
	double max_step_size{0.1};
	int max_steps{100};
	int corrector_steps{4};
	double corrector_tolerance{1.0e-6};
	double step_tolerance{1.0e-6};
};

std::ostream&
operator<<(std::ostream& s, const ContinuationSettings& t);

// The kind of a branch is given twice: "type" and the alternative held
// by data.branch_type. When branch_type is present it wins (it carries
// the curve parameters and mesh); branch_kind() returns the kind that
// every dispatch on the branch uses
struct Branch {
	std::string name;
	BranchKind type{BranchKind::Equilibrium};
	std::string parameter_name;   // continuation parameter
	std::string parent_object;    // object the branch was started from
	BranchData data;
	ContinuationSettings settings;
	std::vector<double> params;   // branch parameter values; empty if none
	int map_iterations{1};        // period of a map cycle branch
};

struct SystemConfig {
	std::string name;
	std::vector<std::string> var_names;
	std::vector<std::string> param_names;
	std::vector<double> params;   // default parameter values
	SystemKind kind{SystemKind::Flow};
};

// a request to the continuation solver: extend a branch or start a
// new one from a point on an existing branch
struct ContinuationRequest {
	std::string object_name;
	std::string branch_name;
	StoragePos point{0};
	ContinuationSettings settings;
	Direction direction{Direction::Forward};
};

// solver tag strings, e.g. "PeriodDoubling"
std::string to_string(StabilityKind k);
// map a solver tag to a StabilityKind; unknown tags give None
StabilityKind parse_stability(const std::string& tag);

// "limit_cycle", "pd_curve", ...
std::string to_string(BranchKind k);
std::optional<BranchKind> parse_branch_kind(const std::string& s);

// is the branch made of periodic orbits (Floquet multipliers
// instead of eigenvalues)?
bool is_cycle_branch(BranchKind k);

// kind_of(data.branch_type) if present, otherwise "type"
BranchKind branch_kind(const Branch& branch);

} // namespace bifview

#endif // BRANCH_H
