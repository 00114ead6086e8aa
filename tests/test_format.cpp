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

#include "format.h"

using namespace bifview;

TEST(FmtNum, Fixed) {
	EXPECT_EQ(fmt_num(0.1234), "0.123");
	EXPECT_EQ(fmt_num(0.0), "0.000");
	EXPECT_EQ(fmt_num(-0.0), "0.000");
	EXPECT_EQ(fmt_num(-0.5), "-0.500");
	EXPECT_EQ(fmt_num(1234.5678), "1234.568");
}

TEST(FmtNum, Exponential) {
	EXPECT_EQ(fmt_num(1.23456e-4), "1.2346e-4");
	EXPECT_EQ(fmt_num(25000.0), "2.5000e+4");
	EXPECT_EQ(fmt_num(-3.0e-7), "-3.0000e-7");
	EXPECT_EQ(fmt_num(1.0e12), "1.0000e+12");
}

TEST(FmtNum, NonFinite) {
	EXPECT_EQ(fmt_num(std::nan("")), "NaN");
	EXPECT_EQ(fmt_num(std::numeric_limits<double>::infinity()), "Infinity");
	EXPECT_EQ(fmt_num(-std::numeric_limits<double>::infinity()), "-Infinity");
	EXPECT_EQ(fmt_safe(std::numeric_limits<double>::infinity()), "NaN");
	EXPECT_EQ(fmt_safe(0.25), "0.250");
}

TEST(FmtFull, Fixed) {
	EXPECT_EQ(fmt_full(0.1), "0.1");
	EXPECT_EQ(fmt_full(100.0), "100");
	EXPECT_EQ(fmt_full(0.0), "0");
	EXPECT_EQ(fmt_full(1.0/3.0), "0.333333333333");
	EXPECT_EQ(fmt_full(-2.5), "-2.5");
}

TEST(FmtFull, Exponential) {
	EXPECT_EQ(fmt_full(1.5e-7), "1.5000000000e-7");
	EXPECT_EQ(fmt_full(2.0e6), "2.0000000000e+6");
}

TEST(FmtArray, List) {
	EXPECT_EQ(fmt_array({}), "[]");
	EXPECT_EQ(fmt_array({1.0, 2.5}), "[1.000, 2.500]");
	EXPECT_EQ(fmt_array({std::nan("")}), "[NaN]");
}
