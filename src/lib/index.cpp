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
#include <numeric>
#include <stdexcept>

#include "index.h"
#include "settings.h"
#include "trace.h"

using namespace std;

namespace bifview {

vector<int>
ensure_indices(const BranchData& data) {
	size_t n = data.points.size();
	if (data.indices.size() == n)
		return data.indices;
	T_(Trace trc(2,"ensure_indices");)
	T_(trc.dprint("branch has ",data.indices.size()," indices for ",n,
		" points: using storage order");)
	vector<int> rval(n);
	std::iota(rval.begin(), rval.end(), 0);
	return rval;
}

vector<StoragePos>
build_sorted_order(const vector<int>& indices) {
	vector<StoragePos> rval(indices.size());
	std::iota(rval.begin(), rval.end(), 0);
	std::stable_sort(rval.begin(), rval.end(),
		[&indices](StoragePos a, StoragePos b) { return indices[a] < indices[b]; });
	return rval;
}

optional<StoragePos>
find_by_logical_index(const vector<int>& indices, int target) {
	// indices are in storage order, not sorted: scan
	for (StoragePos i=0; i<indices.size(); i++)
		if (indices[i] == target)
			return i;
	return nullopt;
}

int
configured_page_size() {
	int rval{10};
	Settings::defaults.get("page_size", rval);
	return rval;
}

Navigator::
Navigator(const BranchData& data, size_t pagesize) :
		_indices(ensure_indices(data)), _page_size(std::max(pagesize, size_t(1))) {
	_order = build_sorted_order(_indices);
	_rank.resize(_order.size());
	for (size_t i=0; i<_order.size(); i++)
		_rank[_order[i]] = i;
}

int
Navigator::
logical(StoragePos pos) const {
	if (pos >= _indices.size())
		throw out_of_range(vastr("storage position ",pos," is not on a branch of ",
			_indices.size()," points"));
	return _indices[pos];
}

size_t
Navigator::
rank(StoragePos pos) const {
	if (pos >= _rank.size())
		throw out_of_range(vastr("storage position ",pos," is not on a branch of ",
			_rank.size()," points"));
	return _rank[pos];
}

optional<StoragePos>
Navigator::
start() const {
	if (_order.empty())
		return nullopt;
	return _order.front();
}

optional<StoragePos>
Navigator::
end() const {
	if (_order.empty())
		return nullopt;
	return _order.back();
}

optional<StoragePos>
Navigator::
previous(StoragePos pos) const {
	size_t r = rank(pos);
	if (r == 0)
		return nullopt;
	return _order[r-1];
}

optional<StoragePos>
Navigator::
next(StoragePos pos) const {
	size_t r = rank(pos);
	if (r+1 >= _order.size())
		return nullopt;
	return _order[r+1];
}

optional<StoragePos>
Navigator::
jump(int logical) const {
	return find_by_logical_index(_indices, logical);
}

size_t
Navigator::
npages() const {
	if (_order.empty())
		return 1;
	return (_order.size() + _page_size - 1)/_page_size;
}

size_t
Navigator::
page_of(StoragePos pos) const {
	return rank(pos)/_page_size;
}

vector<StoragePos>
Navigator::
page(size_t n) const {
// the storage positions on page n in logical order;
// empty if n is past the last page
	vector<StoragePos> rval;
	size_t first = n*_page_size;
	if (first >= _order.size())
		return rval;
	size_t last = std::min(first + _page_size, _order.size());
	rval.assign(_order.begin()+first, _order.begin()+last);
	return rval;
}

} // namespace bifview
