//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "trace.h"

using namespace bifview;

// Each test sends trace output to its own file, sets the debug
// level, and restores the level when it goes out of scope
class TraceTest : public ::testing::Test {
protected:
	std::string path;
	int oldlevel{0};

	void SetUp() override {
		path = ::testing::TempDir() + "bifview_trace_" +
			::testing::UnitTest::GetInstance()->current_test_info()->name() + ".log";
		Trace::logfile(path);
		oldlevel = Trace::debug(1);
		resetDOffset();
	}
	void TearDown() override {
		Trace::debug(oldlevel);
	}
	std::string contents() {
		Trace::logfile()->flush();
		std::ifstream in(path);
		return std::string(std::istreambuf_iterator<char>(in),
			std::istreambuf_iterator<char>());
	}
};

static void
inner() {
	Trace trc(1, "inner");
	trc.dprint("x = ", 2);
}

static void
outer() {
	Trace trc(1, "outer ", 3);
	inner();
}

TEST_F(TraceTest, EnterExitNesting) {
	outer();
	EXPECT_EQ(contents(), "Enter outer 3 {\n Enter inner {\n  x = 2\n Exit inner }\n"
		"Exit outer 3 }\n");
	EXPECT_EQ(DOffset(), "");
}

TEST_F(TraceTest, LevelGating) {
	{
		Trace trc(2, "quiet");
		EXPECT_FALSE(trc());
		trc.dprint("not printed");
		trc.dprintv(std::vector<int>{1, 2}, "nor this");
	}
	EXPECT_EQ(contents(), "");
	EXPECT_EQ(Trace::debug(2), 1);
	{
		Trace trc(2, "loud");
		EXPECT_TRUE(trc());
		EXPECT_EQ(trc.fcnname(), "loud");
	}
	EXPECT_EQ(contents(), "Enter loud {\nExit loud }\n");
}

TEST_F(TraceTest, PrintWithoutNewline) {
	Trace trc(1, "f");
	trc.dprintn("a=", 1);
	trc.dprint(", b=", 2);
	EXPECT_EQ(contents(), "Enter f {\n a=1, b=2\n");
}

TEST_F(TraceTest, SideBySideVectors) {
	Trace trc(1, "g");
	EXPECT_THROW(trc.dprintvv(std::vector<int>{1, 2}, std::vector<double>{1.0}, "ab"),
		std::runtime_error);
	trc.dprintvv(std::vector<int>{1}, std::vector<std::string>{"one"}, "ab");
	EXPECT_EQ(contents(), "Enter g {\n ab: {\n    1  one\n }\n");
}

TEST_F(TraceTest, OffsetsArePerThread) {
	std::vector<std::string> offsets(4);
	std::vector<std::thread> threads;
	for (size_t i=0; i<offsets.size(); i++) {
		threads.emplace_back([&offsets, i]() {
			Trace trc(1, "worker");
			offsets[i] = DOffset();
		});
	}
	for (auto& ti : threads)
		ti.join();
	for (auto& oi : offsets)
		EXPECT_EQ(oi, " ");
	EXPECT_EQ(DOffset(), "");
}

TEST(TraceLogfile, CannotOpen) {
	EXPECT_THROW(Trace::logfile("/nonexistent-dir/trace.log"), std::runtime_error);
}
