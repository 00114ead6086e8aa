//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
#ifndef INDEX_H
#define INDEX_H

//------------------------------------------------------------------
// Logical indexing of the points on a branch. Points are stored in
// append order; a branch extended backward appends points with
// decreasing (negative) logical indices, so navigating along the
// curve requires sorting by logical index.
//------------------------------------------------------------------

#include <optional>
#include <vector>

#include "branch.h"

namespace bifview {

// The logical index of each point, in storage order: the indices
// carried by the branch if there is one per point, otherwise
// 0,1,2,... (storage order taken as the logical order)
std::vector<int> ensure_indices(const BranchData& data);

// storage positions sorted by logical index; points with equal
// logical indices keep their storage order
std::vector<StoragePos> build_sorted_order(const std::vector<int>& indices);

// the first storage position with logical index "target"
std::optional<StoragePos> find_by_logical_index(const std::vector<int>& indices,
		int target);

// the number of points per page configured in Settings::defaults
int configured_page_size();

//------------------------------------------------------------------
// Navigator: Start/Previous/Next/End/Jump and paging over the points
// of a branch in logical order. A Navigator is built from a snapshot
// of the branch and does not change after construction.
// Queries return nullopt when the move is not possible (empty
// branch, first or last point); a storage position that is not
// part of the branch throws std::out_of_range.
//------------------------------------------------------------------
class Navigator {
	std::vector<int> _indices;         // logical index by storage position
	std::vector<StoragePos> _order;    // storage positions in logical order
	std::vector<size_t> _rank;         // position in _order by storage position
	size_t _page_size;
public:
	explicit Navigator(const BranchData& data, size_t pagesize=10);

	size_t size() const { return _order.size(); }
	bool empty() const { return _order.empty(); }
	const std::vector<StoragePos>& order() const { return _order; }
	const std::vector<int>& indices() const { return _indices; }

	// logical index of the point at "pos"
	int logical(StoragePos pos) const;
	// position of "pos" in the logical order
	size_t rank(StoragePos pos) const;

	std::optional<StoragePos> start() const;
	std::optional<StoragePos> end() const;
	std::optional<StoragePos> previous(StoragePos pos) const;
	std::optional<StoragePos> next(StoragePos pos) const;
	std::optional<StoragePos> jump(int logical) const;

	// paging: page n holds ranks [n*page_size, (n+1)*page_size)
	size_t page_size() const { return _page_size; }
	size_t npages() const;
	size_t page_of(StoragePos pos) const;
	std::vector<StoragePos> page(size_t n) const;
};

} // namespace bifview

#endif // INDEX_H
