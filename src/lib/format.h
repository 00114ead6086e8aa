//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
#ifndef FORMAT_H
#define FORMAT_H

// Number formatting for point listings and details

#include <string>
#include <vector>

namespace bifview {

// 3 decimals, or exponential with 4 decimals if 0 < |v| < 1e-3
// or |v| >= 1e4: 0.123, 1.2346e-4, 2.5000e+4
std::string fmt_num(double v);

// 12 significant digits without trailing zeros, or exponential
// with 10 decimals if 0 < |v| < 1e-6 or |v| >= 1e6
std::string fmt_full(double v);

// fmt_num, or "NaN" for NaN and infinity
std::string fmt_safe(double v);

// "[1.000, 2.500]", "[]" if empty
std::string fmt_array(const std::vector<double>& v);

} // namespace bifview

#endif // FORMAT_H
