// Authors: Benjamin Fenker 2013
// Copyright 2013 Benjamin Fenker

#ifndef INCLUDE_FWM_PARAMETERS_H_
#define INCLUDE_FWM_PARAMETERS_H_

#include <string>

using std::string;

enum fwm_input_status {
  input_success = 0,
  input_bad_file = 1,
  input_unknown_key = 2,
  input_bad_value = 3
};

// Everything a fourWaveMixing run needs.  Stored in SI units (rad/s, W/m^2,
// m^-3, m).  Files and the command line use 2pi MHz, mW/cm^2, cm^-3 and cm.
class fwm_parameters {
 public:
  fwm_parameters();

  // key value pairs, one per line, any order.  '#' starts a comment.
  // Returns an fwm_input_status
  int ReadFromFile(string fname);
  // fourWaveMixing isotope Je2 pump_rabi probe_rabi pump_detune out_file
  // Trailing arguments may be left off
  int ReadFromCommandLine(int argc, char* argv[]);
  // Writes a file ReadFromFile will accept
  int PrintToFile(string fname) const;

  string out_file;
  string isotope;
  int Je2;
  int Fg1_2, Fg2_2, Fe2;

  double pump_rabi, probe_rabi;
  double pump_detune, probe_detune;
  double ground_dephasing, optical_dephasing;

  bool rabi_from_intensity;
  double pump_intensity, probe_intensity;
  double number_density;
  double interaction_length;
  double regularization;

  string sweep;
  double sweep_min, sweep_max;
  int sweep_points;
  string sweep2;               // "none" for a 1D sweep
  double sweep2_min, sweep2_max;
  int sweep2_points;

  double tolerance;
  int max_iterations;
  double max_seconds;
  int verbosity;

 private:
  int SetValue(string key, string value);
  // Picks the isotope's default lambda unless the levels were given
  int FinishLambda();
  bool levels_given;
};

#endif  // INCLUDE_FWM_PARAMETERS_H_
