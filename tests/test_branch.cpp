//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-

#include <gtest/gtest.h>

#include "branch.h"
#include "settings.h"

using namespace bifview;

TEST(BranchType, Codim1NamesOfCurves) {
	BranchType fold = FoldCurve{"a", "b"};
	auto names = codim1_names(fold);
	ASSERT_TRUE(names.has_value());
	EXPECT_EQ(names->first, "a");
	EXPECT_EQ(names->second, "b");

	BranchType pd = PDCurve{"mu", "nu", 10, 3};
	names = codim1_names(pd);
	ASSERT_TRUE(names.has_value());
	EXPECT_EQ(names->first, "mu");
	EXPECT_EQ(names->second, "nu");
}

TEST(BranchType, SingleParameterBranchesHaveNoCodim1Names) {
	EXPECT_FALSE(codim1_names(BranchType{Equilibrium{}}).has_value());
	EXPECT_FALSE(codim1_names(BranchType{LimitCycle{20, 4}}).has_value());
}

TEST(BranchType, MeshOfCycleBranches) {
	auto m = mesh_of(BranchType{LimitCycle{30, 5}});
	ASSERT_TRUE(m.has_value());
	EXPECT_EQ(m->ntst, 30);
	EXPECT_EQ(m->ncol, 5);

	m = mesh_of(BranchType{NSCurve{"a", "b", 12, 2}});
	ASSERT_TRUE(m.has_value());
	EXPECT_EQ(m->ntst, 12);
	EXPECT_EQ(m->ncol, 2);

	EXPECT_FALSE(mesh_of(BranchType{HopfCurve{"a", "b"}}).has_value());
	EXPECT_FALSE(mesh_of(BranchType{Equilibrium{}}).has_value());
}

TEST(BranchType, KindOf) {
	EXPECT_EQ(kind_of(BranchType{Equilibrium{}}), BranchKind::Equilibrium);
	EXPECT_EQ(kind_of(BranchType{LPCCurve{"a", "b", 20, 4}}), BranchKind::LPCCurve);
	EXPECT_EQ(kind_of(BranchType{FoldCurve{"a", "b"}}), BranchKind::FoldCurve);
}

TEST(StabilityTags, ParseKnownAndUnknownTags) {
	EXPECT_EQ(parse_stability("PeriodDoubling"), StabilityKind::PeriodDoubling);
	EXPECT_EQ(parse_stability("CycleFold"), StabilityKind::CycleFold);
	EXPECT_EQ(parse_stability("NeutralSaddle"), StabilityKind::NeutralSaddle);
	EXPECT_EQ(parse_stability("Hopf"), StabilityKind::Hopf);
	EXPECT_EQ(parse_stability("BogdanovTakens"), StabilityKind::None);
	EXPECT_EQ(parse_stability(""), StabilityKind::None);
	EXPECT_EQ(to_string(StabilityKind::NeimarkSacker), "NeimarkSacker");
}

TEST(BranchKinds, NamesAndCycleBranches) {
	EXPECT_EQ(to_string(BranchKind::LimitCycle), "limit_cycle");
	EXPECT_EQ(parse_branch_kind("pd_curve"), BranchKind::PDCurve);
	EXPECT_FALSE(parse_branch_kind("homoclinic_curve").has_value());

	EXPECT_TRUE(is_cycle_branch(BranchKind::LimitCycle));
	EXPECT_TRUE(is_cycle_branch(BranchKind::LPCCurve));
	EXPECT_TRUE(is_cycle_branch(BranchKind::PDCurve));
	EXPECT_TRUE(is_cycle_branch(BranchKind::NSCurve));
	EXPECT_FALSE(is_cycle_branch(BranchKind::Equilibrium));
	EXPECT_FALSE(is_cycle_branch(BranchKind::FoldCurve));
	EXPECT_FALSE(is_cycle_branch(BranchKind::HopfCurve));
}

TEST(ContinuationSettings, Defaults) {
	ContinuationSettings s;
	EXPECT_DOUBLE_EQ(s.step_size, 0.01);
	EXPECT_DOUBLE_EQ(s.min_step_size, 1.0e-5);
	EXPECT_DOUBLE_EQ(s.max_step_size, 0.1);
	EXPECT_EQ(s.max_steps, 100);
	EXPECT_EQ(s.corrector_steps, 4);
	EXPECT_DOUBLE_EQ(s.corrector_tolerance, 1.0e-6);
	EXPECT_DOUBLE_EQ(s.step_tolerance, 1.0e-6);

	ContinuationRequest req;
	EXPECT_EQ(req.direction, Direction::Forward);
	EXPECT_EQ(req.settings.max_steps, 100);
}

TEST(DefaultMesh, FollowsSettings) {
	Mesh m = default_mesh();
	EXPECT_EQ(m.ntst, 20);
	EXPECT_EQ(m.ncol, 4);

	int old = Settings::defaults.set("ntst", 40);
	m = default_mesh();
	EXPECT_EQ(m.ntst, 40);
	EXPECT_EQ(m.ncol, 4);
	Settings::defaults.set("ntst", old);
}

TEST(BranchKindOf, BranchTypeWins) {
	Branch b;
	b.type = BranchKind::LimitCycle;
	EXPECT_EQ(branch_kind(b), BranchKind::LimitCycle);
	b.data.branch_type = BranchType{PDCurve{"a", "b", 20, 4}};
	EXPECT_EQ(branch_kind(b), BranchKind::PDCurve);
	// an inconsistent type is overridden
	b.type = BranchKind::Equilibrium;
	EXPECT_EQ(branch_kind(b), BranchKind::PDCurve);
}
