//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-

#include "fptype.h"

namespace bifview {

bool
is_valid(double const& t) {
// is "t" a valid double, i.e. check for NAN, infinity
	return std::isfinite(t);
}

bool
is_valid(std::vector<double> const& a) {
	for (auto ai : a)
		if (!is_valid(ai))
			return false;
	return true;
}

} // namespace bifview
