// Authors: Benjamin Fenker 2013
// Copyright 2012 Benjamin Fenker

#include <math.h>
#include <stdio.h>

#include <gsl/gsl_errno.h>
#include <gsl/gsl_sys.h>
#include "include/fwm_data_structures.h"
#include "include/units.h"

bool fwm_verbose = false;

FWM_Error::FWM_Error(int set_code, const string &what)
    : std::invalid_argument(what), gsl_code(set_code) {}

system_parameters::system_parameters()
    : pump_rabi(0.0), probe_rabi(0.0), pump_detune(0.0), probe_detune(0.0),
      gamma_e1(0.0), gamma_e2(0.0), ground_dephasing(0.0),
      optical_dephasing(0.0) {}

void system_parameters::validate() const {
  const double values[] = {pump_rabi, probe_rabi, pump_detune, probe_detune,
                           gamma_e1, gamma_e2, ground_dephasing,
                           optical_dephasing};
  for (int i = 0; i < 8; i++) {
    if (!gsl_finite(values[i])) {
      throw FWM_Error(GSL_EINVAL, "system parameters must be finite");
    }
  }
  if (pump_rabi < 0.0 || probe_rabi < 0.0) {
    throw FWM_Error(GSL_EINVAL, "Rabi frequencies must be >= 0");
  }
  if (gamma_e1 < 0.0 || gamma_e2 < 0.0) {
    throw FWM_Error(GSL_EINVAL, "decay rates must be >= 0");
  }
  if (ground_dephasing < 0.0 || optical_dephasing < 0.0) {
    throw FWM_Error(GSL_EINVAL, "dephasing rates must be >= 0");
  }
  // Without spontaneous decay there is no steady state to find
  if (total_decay() <= 0.0) {
    throw FWM_Error(GSL_EINVAL, "total excited-state decay rate must be > 0");
  }
}

void system_parameters::print(FILE *des) const {
  fprintf(des, "\tPump:  Omega = %8.6G MHz\tDelta = %+8.6G MHz\n",
          pump_rabi/_2pi_MHz, pump_detune/_2pi_MHz);
  fprintf(des, "\tProbe: Omega = %8.6G MHz\tDelta = %+8.6G MHz\n",
          probe_rabi/_2pi_MHz, probe_detune/_2pi_MHz);
  fprintf(des, "\tGamma(e->1) = %8.6G MHz\tGamma(e->2) = %8.6G MHz\n",
          gamma_e1/_2pi_MHz, gamma_e2/_2pi_MHz);
  fprintf(des, "\tDephasing: ground = %8.6G kHz\toptical = %8.6G kHz\n",
          ground_dephasing/(2.0*M_PI*_kHz),
          optical_dephasing/(2.0*M_PI*_kHz));
}

medium_parameters::medium_parameters()
    : number_density(1.0e11 / _cm3),
      dipole_moment(3.584e-29 * _Cm),
      pump_intensity(100.0 * _mW/_cm2),
      probe_intensity(10.0 * _mW/_cm2),
      interaction_length(1.0 * _cm),
      signal_frequency(2.0*M_PI*_speed_of_light / (780.241 * _nm)),
      regularization(1.0e-6) {}

void medium_parameters::validate() const {
  if (!(number_density > 0.0)) {
    throw FWM_Error(GSL_EDOM, "number density must be > 0");
  }
  if (!(dipole_moment > 0.0)) {
    throw FWM_Error(GSL_EDOM, "dipole moment must be > 0");
  }
  if (!(pump_intensity > 0.0) || !(probe_intensity > 0.0)) {
    throw FWM_Error(GSL_EDOM, "field intensities must be > 0");
  }
  if (!(interaction_length > 0.0)) {
    throw FWM_Error(GSL_EDOM, "interaction length must be > 0");
  }
  if (!(signal_frequency > 0.0)) {
    throw FWM_Error(GSL_EDOM, "signal frequency must be > 0");
  }
  if (!(regularization > 0.0)) {
    throw FWM_Error(GSL_EDOM, "regularization offset must be > 0");
  }
}

Laser_data::Laser_data()
    : intensity(0.0), detune(0.0), field(0.0), rabi(0.0) {}

Laser_data::Laser_data(double set_intensity, double set_detune,
                       double dipole_moment)
    : intensity(set_intensity), detune(set_detune) {
  if (!(intensity > 0.0)) {
    throw FWM_Error(GSL_EDOM, "laser intensity must be > 0");
  }
  if (!(dipole_moment > 0.0)) {
    throw FWM_Error(GSL_EDOM, "dipole moment must be > 0");
  }
  // I = 1/2 eps_0 c E^2
  field = sqrt(2.0 * intensity / (_epsilon_0 * _speed_of_light));
  rabi = dipole_moment * field / _planck_hbar;
}

double Laser_data::intensity_for_rabi(double rabi, double dipole_moment) {
  if (!(rabi > 0.0)) {
    throw FWM_Error(GSL_EINVAL, "Rabi frequency must be > 0");
  }
  if (!(dipole_moment > 0.0)) {
    throw FWM_Error(GSL_EDOM, "dipole moment must be > 0");
  }
  double E = rabi * _planck_hbar / dipole_moment;
  return 0.5 * _epsilon_0 * _speed_of_light * E * E;
}
