// Authors: Benjamin Fenker 2013
// Copyright 2012 Benjamin Fenker

#include <math.h>
#include <stdio.h>
#include <algorithm>
#include <vector>

#include <gsl/gsl_complex.h>
#include <gsl/gsl_complex_math.h>
#include <gsl/gsl_eigen.h>
#include <gsl/gsl_matrix.h>
#include <gsl/gsl_vector.h>

#include "include/density_matrix.h"

extern bool fwm_verbose;

namespace {
// Below this the trace is treated as zero and the matrix carries no
// information about the state
const double kTraceFloor = 1e-12;

Density_Matrix fully_mixed(int numStates) {
  Density_Matrix mixed(numStates);
  for (int i = 0; i < numStates; i++) {
    mixed.set(i, i, gsl_complex_rect(1.0/numStates, 0.0));
  }
  return mixed;
}

void fill_gsl_matrix(const Density_Matrix &dm, gsl_matrix_complex *m) {
  for (int r = 0; r < dm.size(); r++) {
    for (int c = 0; c < dm.size(); c++) {
      gsl_matrix_complex_set(m, r, c, dm.get(r, c));
    }
  }
}
}  // namespace

Density_Matrix::Density_Matrix(int setNumStates)
    : numStates(setNumStates),
      rho(numStates,
          vector<gsl_complex>(numStates, gsl_complex_rect(0.0, 0.0))) {}

gsl_complex Density_Matrix::trace() const {
  gsl_complex tr = gsl_complex_rect(0.0, 0.0);
  for (int i = 0; i < numStates; i++) tr = gsl_complex_add(tr, rho[i][i]);
  return tr;
}

Density_Matrix Density_Matrix::hermitize() const {
  Density_Matrix out(numStates);
  for (int r = 0; r < numStates; r++) {
    for (int c = 0; c < numStates; c++) {
      gsl_complex sum = gsl_complex_add(rho[r][c],
                                        gsl_complex_conjugate(rho[c][r]));
      out.rho[r][c] = gsl_complex_mul_real(sum, 0.5);
    }
  }
  return out;
}

Density_Matrix Density_Matrix::renormalize() const {
  gsl_complex tr = trace();
  if (gsl_complex_abs(tr) < kTraceFloor) {
    if (fwm_verbose) {
      printf("Density matrix has zero trace.  Replacing with fully mixed\n");
    }
    return fully_mixed(numStates);
  }
  Density_Matrix out(numStates);
  for (int r = 0; r < numStates; r++) {
    for (int c = 0; c < numStates; c++) {
      out.rho[r][c] = gsl_complex_div(rho[r][c], tr);
    }
  }
  return out;
}

Density_Matrix Density_Matrix::clamp_eigenvalues() const {
  // gsl_eigen_hermv only looks at the lower triangle, so make sure both
  // halves agree first
  Density_Matrix herm = hermitize();
  gsl_matrix_complex *A = gsl_matrix_complex_alloc(numStates, numStates);
  fill_gsl_matrix(herm, A);

  gsl_vector *eval = gsl_vector_alloc(numStates);
  gsl_matrix_complex *evec = gsl_matrix_complex_alloc(numStates, numStates);
  gsl_eigen_hermv_workspace *w = gsl_eigen_hermv_alloc(numStates);
  gsl_eigen_hermv(A, eval, evec, w);
  gsl_eigen_hermv_free(w);
  gsl_matrix_complex_free(A);

  double sum = 0.0;
  for (int k = 0; k < numStates; k++) {
    double lambda = gsl_vector_get(eval, k);
    if (lambda < 0.0) {
      if (fwm_verbose) printf("Clamping eigenvalue %10.4G to 0\n", lambda);
      lambda = 0.0;
      gsl_vector_set(eval, k, lambda);
    }
    sum += lambda;
  }

  Density_Matrix out(numStates);
  if (sum < kTraceFloor) {
    if (fwm_verbose) printf("No positive eigenvalues.  Using fully mixed\n");
    out = fully_mixed(numStates);
  } else {
    // rho = sum_k lambda_k |v_k><v_k| / sum_k lambda_k
    for (int r = 0; r < numStates; r++) {
      for (int c = 0; c < numStates; c++) {
        gsl_complex element = gsl_complex_rect(0.0, 0.0);
        for (int k = 0; k < numStates; k++) {
          gsl_complex vr = gsl_matrix_complex_get(evec, r, k);
          gsl_complex vc = gsl_matrix_complex_get(evec, c, k);
          gsl_complex term = gsl_complex_mul(vr, gsl_complex_conjugate(vc));
          term = gsl_complex_mul_real(term, gsl_vector_get(eval, k));
          element = gsl_complex_add(element, term);
        }
        out.rho[r][c] = gsl_complex_div_real(element, sum);
      }
    }
  }
  gsl_vector_free(eval);
  gsl_matrix_complex_free(evec);
  return out;
}

Density_Matrix Density_Matrix::repair() const {
  Density_Matrix out = hermitize().renormalize().clamp_eigenvalues();
  if (fwm_verbose) {
    double change = max_deviation(out);
    if (change > 1e-6) {
      printf("Density matrix repaired (largest correction %8.4G)\n", change);
    }
  }
  return out;
}

vector<double> Density_Matrix::eigenvalues() const {
  Density_Matrix herm = hermitize();
  gsl_matrix_complex *A = gsl_matrix_complex_alloc(numStates, numStates);
  fill_gsl_matrix(herm, A);
  gsl_vector *eval = gsl_vector_alloc(numStates);
  gsl_eigen_herm_workspace *w = gsl_eigen_herm_alloc(numStates);
  gsl_eigen_herm(A, eval, w);
  gsl_eigen_herm_free(w);
  gsl_matrix_complex_free(A);

  vector<double> values(numStates, 0.0);
  for (int k = 0; k < numStates; k++) values[k] = gsl_vector_get(eval, k);
  gsl_vector_free(eval);
  std::sort(values.begin(), values.end());
  return values;
}

dm_validation Density_Matrix::validate(double tolerance) const {
  dm_validation report;
  // A hermitian matrix has complex_conjugate(transpose(A)) == A, which also
  // forces the diagonal to be real
  report.hermitian = true;
  for (int r = 0; r < numStates; r++) {
    for (int c = r; c < numStates; c++) {
      gsl_complex diff = gsl_complex_sub(rho[r][c],
                                         gsl_complex_conjugate(rho[c][r]));
      if (gsl_complex_abs(diff) > tolerance) report.hermitian = false;
    }
  }

  gsl_complex tr = trace();
  report.trace_one = (fabs(GSL_REAL(tr) - 1.0) <= tolerance &&
                      fabs(GSL_IMAG(tr)) <= tolerance);

  vector<double> values = eigenvalues();
  report.positive_semidefinite = (values.front() >= -tolerance);

  report.valid = (report.hermitian && report.trace_one &&
                  report.positive_semidefinite);
  return report;
}

double Density_Matrix::max_deviation(const Density_Matrix &other) const {
  double dev = 0.0;
  for (int r = 0; r < numStates; r++) {
    for (int c = 0; c < numStates; c++) {
      double d = gsl_complex_abs(gsl_complex_sub(rho[r][c], other.rho[r][c]));
      dev = std::max(dev, d);
    }
  }
  return dev;
}

void Density_Matrix::print_density_matrix(FILE *des) const {
  // Real part as one matrix, then the imaginary part tabbed over to the
  // right of it
  for (int r = 0; r < numStates; r++) {
    for (int c = 0; c < numStates; c++) {
      fprintf(des, "%10.6G   ", GSL_REAL(rho[r][c]));
    }
    fprintf(des, "\t\t");
    for (int c = 0; c < numStates; c++) {
      fprintf(des, "%10.6G   ", GSL_IMAG(rho[r][c]));
    }
    fprintf(des, "\n");
  }
}
