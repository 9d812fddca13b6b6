// Authors: Benjamin Fenker 2013
// Copyright 2013 Benjamin Fenker

#ifndef INCLUDE_SUSCEPTIBILITY_H_
#define INCLUDE_SUSCEPTIBILITY_H_

#include <vector>
#include <gsl/gsl_complex.h>

#include "./bloch_solver.h"
#include "./density_matrix.h"
#include "./fwm_data_structures.h"

using std::vector;

// Turns steady-state coherences into bulk optical response.  SI units:
// chi1 is dimensionless, chi3 is in m^2/V^2 and the four-wave-mixing signal
// in W/m^2.
class Susceptibility_Engine {
 public:
  // Throws FWM_Error (GSL_EDOM) if any macroscopic parameter is
  // non-positive
  explicit Susceptibility_Engine(medium_parameters set_medium);

  // chi1 = 2 N |d|^2 rho_2e / (eps_0 hbar Omega_c)
  // Absorption is the imaginary part, dispersion the real part.
  gsl_complex linear_susceptibility(const Density_Matrix &rho,
                                    const system_parameters &params) const;

  // chi3 = N |d|^4 / (eps_0 hbar^3) * rho_12 /
  //        [(Delta_c + i Gamma_opt) (delta + i gamma_2ph) Omega_c/2]
  gsl_complex third_order_susceptibility(const Density_Matrix &rho,
                                         const system_parameters &params) const;

  // I = omega^2 L^2 |chi3|^2 I_pump^2 I_probe / (eps_0^2 c^4)
  double fwm_intensity(gsl_complex chi3) const;

  // delta + i (gamma_12 + regularization).  Never exactly zero
  gsl_complex two_photon_denominator(const system_parameters &params) const;

  // Closed-form probe response of the ideal lambda system (no populations
  // solved for), with the same regularized two-photon pole
  gsl_complex eit_response(const system_parameters &params) const;

  // Solve at each probe detuning and fill absorption/dispersion (Im/Re chi1)
  void linear_spectrum(const Bloch_Solver &solver, system_parameters params,
                       const vector<double> &probe_detunes,
                       vector<double> *absorption,
                       vector<double> *dispersion) const;

  medium_parameters medium;

 private:
  void check_inputs(const Density_Matrix &rho,
                    const system_parameters &params) const;
};

#endif  // INCLUDE_SUSCEPTIBILITY_H_
