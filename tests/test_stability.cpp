//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-

#include <cmath>

#include <gtest/gtest.h>

#include "settings.h"
#include "stability.h"

using namespace bifview;

TEST(ClassifyFlow, SignOfRealParts) {
	EXPECT_EQ(classify_flow({{-1.0, 0.0}, {-2.0, 0.0}}), StabilityKind::Stable);
	EXPECT_EQ(classify_flow({{1.0, 0.0}, {-2.0, 0.0}}), StabilityKind::Unstable);
	EXPECT_EQ(classify_flow({{-0.1, 3.0}, {-0.1, -3.0}}), StabilityKind::Stable);
}

TEST(ClassifyFlow, BoundaryIsNone) {
	EXPECT_EQ(classify_flow({{0.0, 1.0}, {0.0, -1.0}, {-1.0, 0.0}}), StabilityKind::None);
	EXPECT_EQ(classify_flow({{-1.0e-8, 0.0}}), StabilityKind::None);
	// an unstable value decides even with a boundary value present
	EXPECT_EQ(classify_flow({{0.0, 0.0}, {0.5, 0.0}}), StabilityKind::Unstable);
	// the tolerance is a parameter
	EXPECT_EQ(classify_flow({{-1.0e-3, 0.0}}, 1.0e-2), StabilityKind::None);
}

TEST(ClassifyFlow, NoUsableData) {
	EXPECT_EQ(classify_flow({}), StabilityKind::None);
	EXPECT_EQ(classify_flow({{std::nan(""), std::nan("")}, {5.0, 0.0}}),
		StabilityKind::None);
}

TEST(ClassifyMap, Moduli) {
	EXPECT_EQ(classify_map({{0.5, 0.0}, {0.9, 0.0}}), StabilityKind::Stable);
	EXPECT_EQ(classify_map({{1.2, 0.0}, {0.5, 0.0}}), StabilityKind::Unstable);
	EXPECT_EQ(classify_map({{-1.2, 0.0}, {0.5, 0.0}}), StabilityKind::Unstable);
	EXPECT_EQ(classify_map({{0.6, 0.8}}), StabilityKind::None);   // |z| = 1
	EXPECT_EQ(classify_map({{0.3, 0.4}}), StabilityKind::Stable);
}

TEST(ClassifyCycle, TrivialMultiplierIsIgnored) {
	EXPECT_EQ(classify_cycle({{1.0, 0.0}, {0.5, 0.0}}), StabilityKind::Stable);
	EXPECT_EQ(classify_cycle({{0.999999, 0.0}, {0.3, 0.2}, {-0.4, 0.0}}),
		StabilityKind::Stable);
	EXPECT_EQ(classify_cycle({{1.0, 0.0}, {1.5, 0.0}}), StabilityKind::Unstable);
	// only one multiplier is trivial: a second one on the unit circle is a boundary
	EXPECT_EQ(classify_cycle({{1.0, 0.0}, {-1.0, 0.0}, {0.2, 0.0}}), StabilityKind::None);
	EXPECT_EQ(classify_cycle({{1.0, 0.0}, {1.0, 0.0}}), StabilityKind::None);
}

TEST(ClassifyCycle, TooFewMultipliers) {
	EXPECT_EQ(classify_cycle({}), StabilityKind::None);
	EXPECT_EQ(classify_cycle({{1.0, 0.0}}), StabilityKind::None);
}

TEST(DeriveStability, DispatchOnSystemAndBranch) {
	ContinuationPoint pt;
	// 1+0i and 0.5+0i: the cycle rule drops the 1 as trivial
	pt.eigenvalues = std::vector<double>{1.0, 0.0, 0.5, 0.0};
	EXPECT_EQ(derive_stability(pt, SystemKind::Flow, BranchKind::LimitCycle),
		StabilityKind::Stable);
	EXPECT_EQ(derive_stability(pt, SystemKind::Flow, BranchKind::PDCurve),
		StabilityKind::Stable);
	// map rule: |1| is a boundary
	EXPECT_EQ(derive_stability(pt, SystemKind::Map, BranchKind::Equilibrium),
		StabilityKind::None);
	// flow rule: real part 1 is unstable
	EXPECT_EQ(derive_stability(pt, SystemKind::Flow, BranchKind::Equilibrium),
		StabilityKind::Unstable);
	EXPECT_EQ(derive_stability(ContinuationPoint{}, SystemKind::Flow,
		BranchKind::Equilibrium), StabilityKind::None);
}

TEST(PointStability, SolverTagWins) {
	ContinuationPoint pt;
	pt.eigenvalues = std::vector<double>{-1.0, 0.0, -2.0, 0.0};
	EXPECT_EQ(point_stability(pt, SystemKind::Flow, BranchKind::Equilibrium),
		StabilityKind::Stable);
	pt.stability = StabilityKind::Hopf;
	EXPECT_EQ(point_stability(pt, SystemKind::Flow, BranchKind::Equilibrium),
		StabilityKind::Hopf);
	pt.stability = StabilityKind::None;
	EXPECT_EQ(point_stability(pt, SystemKind::Flow, BranchKind::Equilibrium),
		StabilityKind::Stable);
}

TEST(DescribeCycleStability, Descriptions) {
	EXPECT_EQ(describe_cycle_stability({}), "unknown");
	EXPECT_EQ(describe_cycle_stability({{1.0, 0.0}, {0.5, 0.0}}), "stable");
	EXPECT_EQ(describe_cycle_stability({{1.0, 0.0}, {2.0, 0.0}}), "unstable (1D)");
	EXPECT_EQ(describe_cycle_stability({{1.0, 0.0}, {2.0, 0.0}, {-3.0, 0.0}}),
		"unstable (2D)");
	EXPECT_EQ(describe_cycle_stability({{1.0, 0.0}, {1.1, 0.5}, {1.1, -0.5}}),
		"unstable (torus)");
	// within trivial_tol of 1
	EXPECT_EQ(describe_cycle_stability({{1.005, 0.0}, {0.2, 0.0}}), "stable");
}

TEST(Tolerances, FollowSettings) {
	EXPECT_DOUBLE_EQ(stability_tol(), default_stability_tol);
	double old = Settings::defaults.set("stability_tol", 1.0e-3);
	EXPECT_DOUBLE_EQ(stability_tol(), 1.0e-3);
	Settings::defaults.set("stability_tol", old);
	EXPECT_DOUBLE_EQ(trivial_tol(), default_trivial_tol);
}
