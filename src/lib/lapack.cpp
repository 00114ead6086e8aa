//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-

// Cover routines for LAPACK subroutines to allow them
// to be called from C++, e.g.
//    lapack::dgeev("n","n",n,a,n,wr,wi,nullptr,1,nullptr,1)

#include <cctype>
#include <stdexcept>
#include <vector>

#include "lapack.h"
#include "trace.h"

using namespace std;

namespace bifview {
namespace lapack {

int
dgeev (char const* jobvl, char const* jobvr, int n, double* a, int lda,
	double* wr, double* wi, double* vl, int ldvl, double* vr, int ldvr) {
	T_(Trace trc(2,"dgeev ",n);)

	int info{0};
	// workspace query
	int lwork{-1};
	double query;
	double dummy{0.0};
	if (tolower(jobvl[0]) == 'n')
		vl = &dummy;
	if (tolower(jobvr[0]) == 'n')
		vr = &dummy;
	dgeev_ (jobvl, jobvr, &n, a, &lda, wr, wi, vl, &ldvl,
				vr, &ldvr, &query, &lwork, &info);
	if (info != 0)
		throw runtime_error(vastr("dgeev workspace query returned info ",info));
	lwork = static_cast<int>(query);
	if (lwork <= 0)
		throw runtime_error(vastr("dgeev returned query ",query));
	T_(trc.dprint("using lwork ",lwork);)

	vector<double> work(lwork, 0.0);

	dgeev_ (jobvl, jobvr, &n, a, &lda, wr, wi, vl, &ldvl,
				vr, &ldvr, work.data(), &lwork, &info);
	return info;
}

} // namespace lapack
} // namespace bifview
