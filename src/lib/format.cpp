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
#include <cstdio>
#include <string>

#include "format.h"
#include "fptype.h"

using namespace std;

namespace bifview {

// text for NaN, +-infinity
static string
nonfinite(double v) {
	if (std::isnan(v))
		return "NaN";
	return v > 0.0 ? "Infinity" : "-Infinity";
}

// exponential notation with "ndec" decimals and a signed exponent
// without leading zeros: 1.2346e-4, 2.5000e+4
static string
exponential(double v, int ndec) {
	char buf[64];
	snprintf(buf, sizeof(buf), "%.*e", ndec, v);
	string s(buf);
	string::size_type e = s.find('e');
	if (e == string::npos)
		return s;
	string mantissa = s.substr(0, e);
	char sign = s[e+1];
	string digits = s.substr(e+2);
	string::size_type nz = digits.find_first_not_of('0');
	digits = (nz == string::npos) ? "0" : digits.substr(nz);
	return mantissa + 'e' + sign + digits;
}

string
fmt_num(double v) {
	if (!is_valid(v))
		return nonfinite(v);
	double a = std::abs(v);
	if ((a != 0.0 && a < 1.0e-3) || a >= 1.0e4)
		return exponential(v, 4);
	if (v == 0.0)
		v = 0.0;   // no "-0.000"
	char buf[64];
	snprintf(buf, sizeof(buf), "%.3f", v);
	return buf;
}

string
fmt_full(double v) {
	if (!is_valid(v))
		return nonfinite(v);
	double a = std::abs(v);
	if ((a != 0.0 && a < 1.0e-6) || a >= 1.0e6)
		return exponential(v, 10);
	if (a == 0.0)
		return "0";
	// fixed notation with 12 significant digits
	int e = static_cast<int>(std::floor(std::log10(a)));
	int ndec = std::max(0, 11 - e);
	char buf[64];
	snprintf(buf, sizeof(buf), "%.*f", ndec, v);
	string rval(buf);
	if (rval.find('.') != string::npos) {
		rval.erase(rval.find_last_not_of('0') + 1);
		if (rval.back() == '.')
			rval.pop_back();
	}
	return rval;
}

string
fmt_safe(double v) {
	if (!is_valid(v))
		return "NaN";
	return fmt_num(v);
}

string
fmt_array(const vector<double>& v) {
	string rval{"["};
	string sep;
	for (auto vi : v) {
		rval += sep + fmt_num(vi);
		sep = ", ";
	}
	return rval + "]";
}

} // namespace bifview
