// Authors: Benjamin Fenker 2013
// Copyright 2012 Benjamin Fenker

#ifndef INCLUDE_DENSITY_MATRIX_H_
#define INCLUDE_DENSITY_MATRIX_H_

#include <stdio.h>
#include <vector>
#include <gsl/gsl_complex.h>

using std::vector;

// Result of checking a density matrix against the three physical
// requirements.  valid is true only if all three pass.
struct dm_validation {
  bool hermitian;
  bool trace_one;
  bool positive_semidefinite;
  bool valid;
};

// Small dense density matrix in the basis {g1, g2, e} (or {g, e} for the
// two-level atom).  None of the transformations modify the matrix they are
// called on; each returns a new one.
class Density_Matrix {
 public:
  explicit Density_Matrix(int numStates = 3);

  int size() const { return numStates; }
  gsl_complex get(int r, int c) const { return rho[r][c]; }
  void set(int r, int c, gsl_complex z) { rho[r][c] = z; }
  double population(int i) const { return GSL_REAL(rho[i][i]); }
  gsl_complex trace() const;

  // (rho + rho^dagger) / 2
  Density_Matrix hermitize() const;
  // rho / Tr(rho).  A matrix with vanishing trace becomes fully mixed
  Density_Matrix renormalize() const;
  // Sets negative eigenvalues to zero, rebuilds from the eigenvectors and
  // renormalizes
  Density_Matrix clamp_eigenvalues() const;
  // hermitize -> renormalize -> clamp_eigenvalues
  Density_Matrix repair() const;

  // Eigenvalues of the Hermitian part, ascending
  vector<double> eigenvalues() const;
  dm_validation validate(double tolerance = 1e-6) const;
  // Largest absolute difference of any element
  double max_deviation(const Density_Matrix &other) const;

  void print_density_matrix(FILE *des) const;

 private:
  int numStates;
  vector<vector<gsl_complex> > rho;
};

#endif  // INCLUDE_DENSITY_MATRIX_H_
