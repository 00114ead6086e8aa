//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
// Copyright (C) 2024 Edward E. Meyer
// This file is part of Bifview; Bifview is free software: you can redistribute
// it and/or modify it under the terms of the GNU General Public License.
// See the file COPYING in the root directory.
// Bifview is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-
#ifndef lapack_h
#define lapack_h

// C++ covers for LAPACK fortran subroutines:
//   - these take int instead of int*
//   - workspace arguments are left off - optimal workspace
//     determined internally
// Fortran names are assumed lower case with a trailing underscore

namespace bifview {
namespace lapack {

// eigenvalues and (optionally) left and right eigenvectors of a
// real nonsymmetric (n,n) column-major matrix "a", which is overwritten.
// Returns the LAPACK info: 0 on success
int dgeev (char const* jobvl, char const* jobvr, int n, double* a, int lda,
	double* wr, double* wi, double* vl, int ldvl, double* vr, int ldvr);

} // namespace lapack
} // namespace bifview

extern "C" {
void dgeev_(char const*, char const*, int* n, double *a, int *lda,
				double* wr, double* wi, double* vl, int* ldv, double* vr, int* ldvr,
				double* work, int* lwork, int* info);
}

#endif // lapack_h
