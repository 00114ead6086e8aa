//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
#ifndef FPTYPE_H
#define FPTYPE_H

#include <cmath>
#include <limits>
#include <vector>

namespace bifview {

// is "a" a valid double, i.e. not NaN or +-infinity
bool is_valid(double const& a);

// are all elements of "a" valid?
bool is_valid(std::vector<double> const& a);

// the quiet NaN used for "not available" values
inline double
nan() { return std::numeric_limits<double>::quiet_NaN(); }

} // namespace bifview

#endif // FPTYPE_H
