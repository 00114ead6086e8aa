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
#include <limits>

#include <gtest/gtest.h>

#include "metrics.h"

using namespace bifview;

TEST(CycleMetrics, OneVariable) {
	CycleMetrics m = cycle_metrics({{0.0}, {2.0}, {4.0}}, 6.5);
	ASSERT_EQ(m.vars.size(), 1u);
	EXPECT_DOUBLE_EQ(m.period, 6.5);
	EXPECT_DOUBLE_EQ(m.vars[0].min, 0.0);
	EXPECT_DOUBLE_EQ(m.vars[0].max, 4.0);
	EXPECT_DOUBLE_EQ(m.vars[0].range, 4.0);
	EXPECT_DOUBLE_EQ(m.vars[0].mean, 2.0);
	EXPECT_DOUBLE_EQ(m.vars[0].rms, std::sqrt(8.0/3.0));
}

TEST(CycleMetrics, TwoVariables) {
	// a coarse circle of radius 2 centered at (1,-1)
	CycleMetrics m = cycle_metrics({{3.0, -1.0}, {1.0, 1.0}, {-1.0, -1.0},
		{1.0, -3.0}}, 1.0);
	ASSERT_EQ(m.vars.size(), 2u);
	EXPECT_DOUBLE_EQ(m.vars[0].mean, 1.0);
	EXPECT_DOUBLE_EQ(m.vars[1].mean, -1.0);
	EXPECT_DOUBLE_EQ(m.vars[0].range, 4.0);
	EXPECT_DOUBLE_EQ(m.vars[1].min, -3.0);
	EXPECT_DOUBLE_EQ(m.vars[0].rms, std::sqrt(2.0));
	EXPECT_DOUBLE_EQ(m.vars[1].rms, std::sqrt(2.0));
}

TEST(CycleMetrics, ConstantProfile) {
	CycleMetrics m = cycle_metrics({{0.5}, {0.5}}, 2.0);
	ASSERT_EQ(m.vars.size(), 1u);
	EXPECT_DOUBLE_EQ(m.vars[0].range, 0.0);
	EXPECT_DOUBLE_EQ(m.vars[0].rms, 0.0);
}

TEST(CycleMetrics, EmptyOrRagged) {
	EXPECT_TRUE(cycle_metrics({}, 1.0).vars.empty());
	CycleMetrics m = cycle_metrics({{0.0, 1.0}, {2.0}}, 3.0);
	EXPECT_TRUE(m.vars.empty());
	EXPECT_DOUBLE_EQ(m.period, 3.0);
}

TEST(CycleMetrics, NonFiniteValuesGiveNaN) {
	CycleMetrics m = cycle_metrics({{0.0, 1.0}, {std::nan(""), 2.0}, {4.0, 3.0}}, 1.0);
	ASSERT_EQ(m.vars.size(), 2u);
	EXPECT_TRUE(std::isnan(m.vars[0].min));
	EXPECT_TRUE(std::isnan(m.vars[0].max));
	EXPECT_TRUE(std::isnan(m.vars[0].range));
	EXPECT_TRUE(std::isnan(m.vars[0].mean));
	EXPECT_TRUE(std::isnan(m.vars[0].rms));
	// the other variable is unaffected
	EXPECT_DOUBLE_EQ(m.vars[1].range, 2.0);
	EXPECT_DOUBLE_EQ(m.vars[1].mean, 2.0);

	m = cycle_metrics({{std::numeric_limits<double>::infinity()}, {1.0}}, 1.0);
	ASSERT_EQ(m.vars.size(), 1u);
	EXPECT_TRUE(std::isnan(m.vars[0].max));
}
