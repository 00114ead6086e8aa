//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
#ifndef METRICS_H
#define METRICS_H

// Summary measures of a periodic orbit profile

#include <iostream>
#include <vector>

namespace bifview {

struct VariableMetrics {
	double min;
	double max;
	double range;   // max - min
	double mean;
	double rms;     // rms deviation from the mean
};

std::ostream&
operator<<(std::ostream& s, const VariableMetrics& t);

struct CycleMetrics {
	std::vector<VariableMetrics> vars;   // one per state variable
	double period;
};

// Per-variable metrics of a profile; the period is passed through.
// An empty profile, or one whose points differ in length, gives
// an empty list. A variable with a NaN or infinite value anywhere
// in the profile gets NaN for all five measures
CycleMetrics cycle_metrics(const std::vector<std::vector<double>>& profile,
		double period);

} // namespace bifview

#endif // METRICS_H
