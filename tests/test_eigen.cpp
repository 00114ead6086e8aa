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
#include <stdexcept>

#include <gtest/gtest.h>

#include "eigen.h"

using namespace bifview;

TEST(NormalizeEigenvalues, AbsentDataIsEmpty) {
	EXPECT_TRUE(normalize_eigenvalues(RawEigen{}).empty());
	EXPECT_TRUE(normalize_eigenvalues(RawEigen{std::vector<double>{}}).empty());
}

TEST(NormalizeEigenvalues, FlatPairs) {
	RawEigen raw = std::vector<double>{1.0, -2.0, 3.0, 4.0};
	auto ev = normalize_eigenvalues(raw);
	ASSERT_EQ(ev.size(), 2u);
	EXPECT_DOUBLE_EQ(ev[0].re, 1.0);
	EXPECT_DOUBLE_EQ(ev[0].im, -2.0);
	EXPECT_DOUBLE_EQ(ev[1].re, 3.0);
	EXPECT_DOUBLE_EQ(ev[1].im, 4.0);
}

TEST(NormalizeEigenvalues, OddFlatListEndsWithUnavailableValue) {
	RawEigen raw = std::vector<double>{1.0, 0.0, 2.0};
	auto ev = normalize_eigenvalues(raw);
	ASSERT_EQ(ev.size(), 2u);
	EXPECT_DOUBLE_EQ(ev[0].re, 1.0);
	EXPECT_TRUE(std::isnan(ev[1].re));
	EXPECT_TRUE(std::isnan(ev[1].im));
}

TEST(NormalizeEigenvalues, MissingComponentsKeepTheirPosition) {
	std::vector<EigenRecord> recs(3);
	recs[0].re = -1.0;
	recs[0].im = 0.5;
	recs[1].re = 2.0;          // imaginary part missing
	recs[2].re = 0.0;
	recs[2].im = std::nan("");
	auto ev = normalize_eigenvalues(RawEigen{recs});
	ASSERT_EQ(ev.size(), 3u);
	EXPECT_DOUBLE_EQ(ev[0].re, -1.0);
	EXPECT_DOUBLE_EQ(ev[0].im, 0.5);
	EXPECT_TRUE(std::isnan(ev[1].re));
	EXPECT_TRUE(std::isnan(ev[1].im));
	EXPECT_TRUE(std::isnan(ev[2].re));
	EXPECT_TRUE(std::isnan(ev[2].im));
}

TEST(EigenvaluesOf, RotationMatrix) {
	// [0 1; -1 0] column-major
	std::vector<double> a{0.0, -1.0, 1.0, 0.0};
	auto ev = eigenvalues_of(2, a);
	ASSERT_EQ(ev.size(), 2u);
	std::sort(ev.begin(), ev.end(),
		[](const ComplexValue& x, const ComplexValue& y) { return x.im < y.im; });
	EXPECT_NEAR(ev[0].re, 0.0, 1.0e-12);
	EXPECT_NEAR(ev[0].im, -1.0, 1.0e-12);
	EXPECT_NEAR(ev[1].re, 0.0, 1.0e-12);
	EXPECT_NEAR(ev[1].im, 1.0, 1.0e-12);
}

TEST(EigenvaluesOf, TriangularMatrix) {
	// [2 5; 0 -3] column-major
	std::vector<double> a{2.0, 0.0, 5.0, -3.0};
	auto ev = eigenvalues_of(2, a);
	ASSERT_EQ(ev.size(), 2u);
	std::sort(ev.begin(), ev.end(),
		[](const ComplexValue& x, const ComplexValue& y) { return x.re < y.re; });
	EXPECT_NEAR(ev[0].re, -3.0, 1.0e-12);
	EXPECT_NEAR(ev[1].re, 2.0, 1.0e-12);
	EXPECT_DOUBLE_EQ(ev[0].im, 0.0);
	EXPECT_DOUBLE_EQ(ev[1].im, 0.0);
}

TEST(EigenvaluesOf, WrongSizeThrows) {
	EXPECT_THROW(eigenvalues_of(3, std::vector<double>{1.0, 2.0}), std::runtime_error);
	EXPECT_TRUE(eigenvalues_of(0, std::vector<double>{}).empty());
}

TEST(EigenHydration, DetectsMissingData) {
	ContinuationPoint pt;
	EXPECT_TRUE(needs_eigen_hydration(pt));
	pt.eigenvalues = std::vector<double>{std::nan(""), 0.0};
	EXPECT_TRUE(needs_eigen_hydration(pt));
	pt.eigenvalues = std::vector<double>{-1.0, 0.0};
	EXPECT_FALSE(needs_eigen_hydration(pt));
}

TEST(EigenHydration, SkipsCodim1CurvesOfEquilibria) {
	Branch b;
	b.data.points.resize(3);
	b.data.points[1].eigenvalues = std::vector<double>{-1.0, 0.0};

	b.type = BranchKind::Equilibrium;
	std::vector<StoragePos> missing = points_needing_eigenvalues(b);
	ASSERT_EQ(missing.size(), 2u);
	EXPECT_EQ(missing[0], 0u);
	EXPECT_EQ(missing[1], 2u);

	b.type = BranchKind::FoldCurve;
	EXPECT_TRUE(points_needing_eigenvalues(b).empty());
	b.type = BranchKind::HopfCurve;
	EXPECT_TRUE(points_needing_eigenvalues(b).empty());
}

TEST(HopfFrequency, PicksSmallestRealPart) {
	std::vector<ComplexValue> ev{{0.5, 2.0}, {0.1, 1.0}, {0.1, 3.0}};
	// two with |re| = 0.1: the larger |im| wins
	EXPECT_DOUBLE_EQ(hopf_frequency(ev), 3.0);

	std::vector<ComplexValue> ev2{{0.2, 4.0}, {-1.0e-8, -1.5}, {-3.0, 0.0}};
	EXPECT_DOUBLE_EQ(hopf_frequency(ev2), 1.5);
}

TEST(HopfFrequency, NoComplexPair) {
	EXPECT_DOUBLE_EQ(hopf_frequency({}), 1.0);
	std::vector<ComplexValue> real{{-1.0, 0.0}, {-2.0, 0.0}};
	EXPECT_DOUBLE_EQ(hopf_frequency(real), 1.0);
}

TEST(HopfFrequency, IgnoresUnavailableValues) {
	std::vector<ComplexValue> ev{{std::nan(""), std::nan("")}, {0.0, 2.0}, {0.0, -2.0}};
	EXPECT_DOUBLE_EQ(hopf_frequency(ev), 2.0);
}
