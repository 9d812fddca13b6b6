// Authors: Benjamin Fenker 2013
// Copyright 2012 Benjamin Fenker

#ifndef INCLUDE_FWM_DATA_STRUCTURES_H_
#define INCLUDE_FWM_DATA_STRUCTURES_H_

#include <stdio.h>
#include <stdexcept>
#include <string>

using std::string;

// Thrown for caller-correctable input problems.  code() is the GSL error
// number describing the problem (GSL_EINVAL, GSL_EDOM or GSL_EBADLEN).
class FWM_Error : public std::invalid_argument {
 public:
  FWM_Error(int set_code, const string &what);
  int code() const { return gsl_code; }

 private:
  int gsl_code;
};

// Everything the Bloch solver needs to know about one lambda system at one
// point.  All rates and detunings are angular frequencies [rad/s].
// Pump couples ground 1 to the excited state, probe couples ground 2.
struct system_parameters {
  system_parameters();
  double pump_rabi, probe_rabi;
  double pump_detune, probe_detune;
  double gamma_e1, gamma_e2;    // Spontaneous decay e --> g1 and e --> g2
  double ground_dephasing;      // Extra decay of rho_12
  double optical_dephasing;     // Extra decay of rho_1e and rho_2e

  double total_decay() const { return gamma_e1 + gamma_e2; }
  double two_photon_detune() const { return pump_detune - probe_detune; }
  // Throws FWM_Error if anything is unphysical
  void validate() const;
  void print(FILE *des) const;
};

// Macroscopic (bulk) properties needed to turn coherences into
// susceptibilities and a four-wave-mixing signal.  SI units.
struct medium_parameters {
  medium_parameters();
  double number_density;        // atoms/m^3
  double dipole_moment;         // probe transition dipole [C m]
  double pump_intensity;        // W/m^2
  double probe_intensity;       // W/m^2
  double interaction_length;    // m
  double signal_frequency;      // angular frequency of generated field
  double regularization;        // imaginary offset in two-photon denominator
  // Throws FWM_Error (GSL_EDOM) for non-positive values
  void validate() const;
};

class Laser_data {
 public:
  Laser_data();
  Laser_data(double set_intensity, double set_detune, double dipole_moment);
  static double intensity_for_rabi(double rabi, double dipole_moment);
  double intensity;             // W/m^2
  double detune;                // rad/s
  double field;                 // peak electric field [V/m]
  double rabi;                  // rad/s
};

// One double-lambda configuration of a particular isotope.  Frequencies are
// angular.  Filled in by Rubidium::setupDoubleLambda
struct lambda_data {
  string isotope;
  int I2, Je2;
  int Fg1_2, Fg2_2, Fe2;
  double gamma_spon;                  // natural decay of excited level
  double gamma_e1, gamma_e2;          // partial rates into g1 and g2
  double dipole_pump, dipole_probe;   // effective transition dipoles
  double omega_pump, omega_probe;     // transition angular frequencies
  double ground_splitting;            // angular frequency g2 - g1
};

#endif  // INCLUDE_FWM_DATA_STRUCTURES_H_
