// Authors: Benjamin Fenker 2013
// Copyright 2013 Benjamin Fenker

#include <math.h>
#include <gsl/gsl_complex_math.h>
#include <gsl/gsl_errno.h>
#include <gsl/gsl_sys.h>

#include "include/two_level_solver.h"
#include "include/fwm_data_structures.h"

Two_Level_Solver::Two_Level_Solver(double set_rabi, double set_detune,
                                   double set_gamma, double set_dephasing)
    : rabi(set_rabi), detune(set_detune), gamma(set_gamma),
      dephasing(set_dephasing) {
  if (!gsl_finite(rabi) || !gsl_finite(detune) || !gsl_finite(gamma) ||
      !gsl_finite(dephasing)) {
    throw FWM_Error(GSL_EINVAL, "two-level parameters must be finite");
  }
  if (rabi < 0.0) throw FWM_Error(GSL_EINVAL, "Rabi frequency must be >= 0");
  if (gamma <= 0.0) throw FWM_Error(GSL_EINVAL, "decay rate must be > 0");
  if (dephasing < 0.0) {
    throw FWM_Error(GSL_EINVAL, "dephasing rate must be >= 0");
  }
}

double Two_Level_Solver::lorentzian_denominator() const {
  double G = gamma/2.0 + dephasing;
  return detune*detune + G*G + rabi*rabi*G/gamma;
}

double Two_Level_Solver::excited_population() const {
  // Saturates at 1/2 for Omega >> gamma
  double G = gamma/2.0 + dephasing;
  return rabi*rabi*G / (2.0*gamma*lorentzian_denominator());
}

gsl_complex Two_Level_Solver::coherence() const {
  double G = gamma/2.0 + dephasing;
  double scale = (rabi/2.0) / lorentzian_denominator();
  return gsl_complex_rect(scale*detune, scale*G);
}

Density_Matrix Two_Level_Solver::solve() const {
  Density_Matrix dm(2);
  double ee = excited_population();
  gsl_complex ge = coherence();
  dm.set(0, 0, gsl_complex_rect(1.0 - ee, 0.0));
  dm.set(1, 1, gsl_complex_rect(ee, 0.0));
  dm.set(0, 1, ge);
  dm.set(1, 0, gsl_complex_conjugate(ge));
  return dm;
}
