// Authors: Benjamin Fenker 2013
// Copyright 2013 Benjamin Fenker

#include <math.h>
#include <stdio.h>

#include <gsl/gsl_complex.h>
#include <gsl/gsl_complex_math.h>
#include <gsl/gsl_errno.h>

#include "include/susceptibility.h"
#include "include/units.h"

Susceptibility_Engine::Susceptibility_Engine(medium_parameters set_medium)
    : medium(set_medium) {
  medium.validate();
}

void Susceptibility_Engine::check_inputs(const Density_Matrix &rho,
                                         const system_parameters &params)
    const {
  if (rho.size() != 3) {
    throw FWM_Error(GSL_EBADLEN, "susceptibility needs a 3x3 density matrix");
  }
  params.validate();
  // Everything is normalized to the probe field
  if (!(params.probe_rabi > 0.0)) {
    throw FWM_Error(GSL_EINVAL, "probe Rabi frequency must be > 0");
  }
}

gsl_complex Susceptibility_Engine::linear_susceptibility(
    const Density_Matrix &rho, const system_parameters &params) const {
  check_inputs(rho, params);
  double d2 = medium.dipole_moment * medium.dipole_moment;
  double prefactor = 2.0 * medium.number_density * d2 /
      (_epsilon_0 * _planck_hbar * params.probe_rabi);
  return gsl_complex_mul_real(rho.get(1, 2), prefactor);
}

gsl_complex Susceptibility_Engine::two_photon_denominator(
    const system_parameters &params) const {
  return gsl_complex_rect(params.two_photon_detune(),
                          params.ground_dephasing + medium.regularization);
}

gsl_complex Susceptibility_Engine::third_order_susceptibility(
    const Density_Matrix &rho, const system_parameters &params) const {
  check_inputs(rho, params);
  double d2 = medium.dipole_moment * medium.dipole_moment;
  double prefactor = medium.number_density * d2 * d2 /
      (_epsilon_0 * pow(_planck_hbar, 3.0));

  double gamma_opt = params.total_decay()/2.0 + params.optical_dephasing;
  gsl_complex optical = gsl_complex_rect(params.probe_detune, gamma_opt);
  gsl_complex denominator = gsl_complex_mul(optical,
                                            two_photon_denominator(params));
  denominator = gsl_complex_mul_real(denominator, params.probe_rabi/2.0);

  gsl_complex chi3 = gsl_complex_div(rho.get(0, 1), denominator);
  return gsl_complex_mul_real(chi3, prefactor);
}

double Susceptibility_Engine::fwm_intensity(gsl_complex chi3) const {
  double omega = medium.signal_frequency;
  double L = medium.interaction_length;
  double c2 = _speed_of_light * _speed_of_light;
  double intensity = omega*omega * L*L * gsl_complex_abs2(chi3);
  intensity *= medium.pump_intensity * medium.pump_intensity;
  intensity *= medium.probe_intensity;
  intensity /= (_epsilon_0 * _epsilon_0 * c2 * c2);
  return intensity;
}

gsl_complex Susceptibility_Engine::eit_response(
    const system_parameters &params) const {
  params.validate();
  gsl_complex optical = gsl_complex_rect(params.probe_detune,
                                         params.total_decay()/2.0);
  double coupling = params.pump_rabi * params.pump_rabi / 4.0;
  gsl_complex dressing = gsl_complex_div(gsl_complex_rect(coupling, 0.0),
                                         two_photon_denominator(params));
  gsl_complex denominator = gsl_complex_add(optical, dressing);
  double numerator = params.probe_rabi * params.probe_rabi;
  return gsl_complex_div(gsl_complex_rect(numerator, 0.0), denominator);
}

void Susceptibility_Engine::linear_spectrum(
    const Bloch_Solver &solver, system_parameters params,
    const vector<double> &probe_detunes, vector<double> *absorption,
    vector<double> *dispersion) const {
  absorption->assign(probe_detunes.size(), 0.0);
  dispersion->assign(probe_detunes.size(), 0.0);
  int unconverged = 0;
  for (size_t i = 0; i < probe_detunes.size(); i++) {
    params.probe_detune = probe_detunes[i];
    steady_state state = solver.solve(params);
    if (!state.converged) unconverged++;
    gsl_complex chi1 = linear_susceptibility(state.rho, params);
    (*absorption)[i] = GSL_IMAG(chi1);
    (*dispersion)[i] = GSL_REAL(chi1);
  }
  if (unconverged > 0) {
    printf("WARNING: %d of %zu spectrum points did not converge\n",
           unconverged, probe_detunes.size());
  }
}
