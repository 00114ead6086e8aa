//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// functions for counting warning messages

#include <atomic>

#include "message.h"

using namespace std;

namespace bifview {

static atomic<int> WarningCount{0};

void
incr_nwarnings() { WarningCount++; }

/*--------------------------------------------------------------------
 * nwarnings:      returns the number of warnings printed
 *------------------------------------------------------------------*/
int
nwarnings () { return WarningCount; }

} // namespace bifview
