//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
#ifndef LABELS_H
#define LABELS_H

// Human-readable names for bifurcations, points and branches

#include <optional>
#include <string>

#include "branch.h"

namespace bifview {

// "Period Doubling", "Neimark-Sacker", ...; "Unknown" for None
std::string bifurcation_type_name(StabilityKind kind);

// the same for a solver tag string, including tags of codimension-2
// points ("BogdanovTakens" is "Bogdanov-Takens"); tags without a
// fixed name are split at lower-to-upper case changes and
// underscores; "Unknown" for "" or "None"
std::string bifurcation_type_name(const std::string& tag);

// Label for a point: "Index 12 - Hopf". Any kind is accepted;
// an absent kind or None gives "Index 12 - Unknown"
std::string bifurcation_label(int logical, std::optional<StabilityKind> kind);

// what an equilibrium is called in a system of kind "sk":
// "Equilibrium" for flows, "Fixed point" or "3-cycle" for maps
std::string equilibrium_label(SystemKind sk, int map_iterations=1,
		bool plural=false, bool lowercase=false);

// the type of a branch for display: "limit cycle", "fold curve";
// branches of equilibria of a map are named for what they contain,
// e.g. "fixed point" or "4-cycle"
std::string branch_type_label(SystemKind sk, const Branch& branch);

} // namespace bifview

#endif // LABELS_H
