// Authors: Benjamin Fenker 2013
// Copyright 2013 Benjamin Fenker

#ifndef INCLUDE_BLOCH_SOLVER_H_
#define INCLUDE_BLOCH_SOLVER_H_

#include <stddef.h>
#include <gsl/gsl_vector.h>

#include "./density_matrix.h"
#include "./fwm_data_structures.h"

// Real layout of the three-level density matrix used by the residual
// function.  Index into the rho[] and drho[] arrays of obe_residuals
enum obe_index {
  kRho11 = 0,
  kRho22 = 1,
  kRhoEE = 2,
  kRe12 = 3, kIm12 = 4,
  kRe1e = 5, kIm1e = 6,
  kRe2e = 7, kIm2e = 8,
  kNumOBETerms = 9
};

struct solver_options {
  solver_options();
  double epsabs;             // residual tolerance in units of the largest rate
  size_t max_iterations;     // per point
  double max_seconds;        // wall-clock cap per point
  double tolerance;          // for the validation report
  double seed_population_g1;  // rest of the seed population is in g2
};

struct steady_state {
  Density_Matrix rho;        // Always repaired
  dm_validation report;
  bool converged;
  int status;                // Last GSL status (GSL_SUCCESS if converged)
  size_t iterations;
  double residual;           // |f| at the returned point, scaled units
};

// Handed through the void* of the gsl_multiroot_function
struct obe_data_for_gsl {
  system_parameters params;
  double rate_scale;
  // A ground level with no light on it and no decay into it keeps whatever
  // population it was seeded with
  bool pin_g1, pin_g2;
  double seed_g1, seed_g2;
};

// Steady state of the double-lambda optical Bloch equations
//
//   basis {g1, g2, e}, pump on g1 <--> e, probe on g2 <--> e
//   H = Delta_p |g1><g1| + Delta_c |g2><g2|
//       + Omega_p/2 (|g1><e| + h.c.) + Omega_c/2 (|g2><e| + h.c.)
//
// found with the derivative-free GSL hybrid root finder.  rho_ee is
// eliminated with the trace so 8 real unknowns remain.  The answer is
// always passed through Density_Matrix::repair before it is returned.
class Bloch_Solver {
 public:
  Bloch_Solver();
  explicit Bloch_Solver(solver_options set_options);

  // Throws FWM_Error for invalid parameters.  Non-convergence is reported
  // in the returned steady_state, never thrown.
  steady_state solve(const system_parameters &params) const;

  // Ground-state population split according to seed_population_g1, no
  // coherences
  Density_Matrix seed_state() const;

  // d(rho)/dt for the layout in obe_index.  Pure, so the steady state is
  // exactly where all nine outputs vanish
  static void obe_residuals(const double rho[], const system_parameters &params,
                            double drho[]);
  static int steady_state_gsl(const gsl_vector *x, void *data, gsl_vector *f);
  static Density_Matrix to_density_matrix(const double rho[]);
  // Largest rate in the problem.  Used to make the residuals O(1)
  static double rate_scale(const system_parameters &params);

  const solver_options &settings() const { return options; }

 private:
  // Checked once in the constructor and read-only afterwards
  solver_options options;
};

#endif  // INCLUDE_BLOCH_SOLVER_H_
