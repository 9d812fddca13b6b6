// Authors: Benjamin Fenker 2013
// Copyright 2013 Benjamin Fenker

#ifndef INCLUDE_TWO_LEVEL_SOLVER_H_
#define INCLUDE_TWO_LEVEL_SOLVER_H_

#include <gsl/gsl_complex.h>
#include "./density_matrix.h"

// Steady state of a single driven two-level atom in the rotating-wave
// approximation.  Closed form, so it doubles as a check on the three-level
// solver when the probe is switched off.
//
// H = Delta |g><g| + Omega/2 (|g><e| + |e><g|), excited state decays at
// gamma and the optical coherence picks up an extra dephasing.
class Two_Level_Solver {
 public:
  // Throws FWM_Error for negative Rabi frequency, decay or dephasing and for
  // zero decay
  Two_Level_Solver(double set_rabi, double set_detune, double set_gamma,
                   double set_dephasing = 0.0);

  double excited_population() const;
  // rho_ge
  gsl_complex coherence() const;
  // Basis {g, e}
  Density_Matrix solve() const;

  double rabi, detune, gamma, dephasing;

 private:
  // Delta^2 + G^2 + Omega^2 G / gamma with G = gamma/2 + dephasing
  double lorentzian_denominator() const;
};

#endif  // INCLUDE_TWO_LEVEL_SOLVER_H_
